// file      : prel/version-file.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/diagnostics.hxx>
#include <prel/version-file.hxx>
#include <prel/fake-repository.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace prel
{
  static options
  parse_options (const strings& args)
  {
    cli::vector_scanner s (args);

    options o;
    o.parse (s);
    return o;
  }

  // Return true if the function fails with the specified failure kind.
  //
  template <typename F>
  static bool
  fails (failure k, F f)
  {
    try
    {
      f ();
    }
    catch (const failed& e)
    {
      return e.kind == k;
    }

    return false;
  }

  int
  main ()
  {
    using vf = version_file;

    // Plain.
    //
    {
      vf f (path ("VERSION"), vf::plain);

      assert (f.versions ("1.4.0\n") == strings {"1.4.0"});
      assert (f.versions (" 1.4.0 \r\n") == strings {"1.4.0"});
      assert (f.versions ("\n") == strings {""});

      assert (f.rewrite ("1.4.0\n", "1.5.0") == "1.5.0\n");
      assert (f.rewrite ("1.4.0", "1.5.0") == "1.5.0");
    }

    // Formatted.
    //
    {
      vf f (path ("src/version.py"),
            vf::formatted,
            "__version__ = '{version}'\n");

      assert (f.versions ("__version__ = '1.4.0'\n") == strings {"1.4.0"});
      assert (f.versions ("version = 1.4.0\n").empty ());

      assert (f.rewrite ("__version__ = '1.4.0'\n", "1.5.0") ==
              "__version__ = '1.5.0'\n");

      // Regex special characters in the format are literals.
      //
      vf g (path ("v.h"),
            vf::formatted,
            "#define V (\"{version}\") // {{x}}");
      assert (g.versions ("#define V (\"2.0\") // {x}") == strings {"2.0"});
      assert (g.rewrite ("", "2.1") == "#define V (\"2.1\") // {x}");

      // Repeated placeholder.
      //
      vf h (path ("v"), vf::formatted, "{version}-{version}");
      assert (h.versions ("1.0-1.0") == (strings {"1.0", "1.0"}));

      for (const char* bad: {"no placeholder", "{version", "{ver}"})
      {
        try
        {
          vf v (path ("v"), vf::formatted, bad);
          assert (false);
        }
        catch (const invalid_argument&) {}
      }
    }

    // Pattern.
    //
    {
      vf f (path ("setup.py"), vf::pattern, "version=\"([^\"]+)\"");

      string c ("from setuptools import setup\n"
                "setup(name=\"foo\",\n"
                "      version=\"1.4.0\",\n"
                "      license=\"MIT\")\n");

      assert (f.versions (c) == strings {"1.4.0"});

      string r (f.rewrite (c, "1.5.0"));
      assert (r == "from setuptools import setup\n"
                   "setup(name=\"foo\",\n"
                   "      version=\"1.5.0\",\n"
                   "      license=\"MIT\")\n");

      assert (f.versions ("setup(name=\"foo\")").empty ());

      // Without a capture group the entire match is the version.
      //
      vf g (path ("configure.ac"), vf::pattern, "[0-9]+\\.[0-9]+\\.[0-9]+");
      assert (g.versions ("AC_INIT([foo], [1.4.0])") == strings {"1.4.0"});
      assert (g.rewrite ("AC_INIT([foo], [1.4.0])", "1.5.0") ==
              "AC_INIT([foo], [1.5.0])");

      try
      {
        vf v (path ("x"), vf::pattern, "version=(");
        assert (false);
      }
      catch (const invalid_argument&) {}
    }

    // Options.
    //
    {
      version_files fs (
        parse_options ({"--version-file", "VERSION",
                        "--version-format", "src/v.txt=Version: {version}",
                        "--version-pattern", "setup.py=version='([^']+)'"}));

      assert (fs.size () == 3);
      assert (fs[0].kind == vf::plain     && fs[0].file == path ("VERSION"));
      assert (fs[1].kind == vf::formatted && fs[1].file == path ("src/v.txt"));
      assert (fs[2].kind == vf::pattern   && fs[2].file == path ("setup.py"));

      assert (version_paths (fs) ==
              (strings {"VERSION", "src/v.txt", "setup.py"}));

      auto config = [] (const strings& args)
      {
        return fails (failure::config,
                      [&args] {parse_version_files (parse_options (args));});
      };

      assert (config ({}));
      assert (config ({"--version-file", "/etc/VERSION"}));
      assert (config ({"--version-file", "VERSION",
                       "--version-format", "VERSION={version}"}));
      assert (config ({"--version-format", "v.txt=1.0"}));
      assert (config ({"--version-pattern", "v.txt=(["}));
    }

    // Read and write through the repository.
    //
    {
      fake_repository r;
      r.init ("master", {{"VERSION", "1.4.0\n"},
                         {"setup.py", "setup(version=\"1.4.0\")\n"}});

      version_files fs {
        vf (path ("VERSION"), vf::plain),
        vf (path ("setup.py"), vf::pattern, "version=\"([^\"]+)\"")};

      assert (read_version (r, fs) == "1.4.0");

      write_version (r, fs, "1.5.0");
      assert (r.work["VERSION"] == "1.5.0\n");
      assert (r.work["setup.py"] == "setup(version=\"1.5.0\")\n");
      assert (read_version (r, fs) == "1.5.0");

      // Inconsistent, missing, and empty versions.
      //
      r.work["setup.py"] = "setup(version=\"1.4.9\")\n";
      assert (fails (failure::version, [&r, &fs] {read_version (r, fs);}));

      r.work["setup.py"] = "setup()\n";
      assert (fails (failure::version, [&r, &fs] {read_version (r, fs);}));

      r.work["VERSION"] = "\n";
      assert (fails (failure::version, [&r, &fs] {read_version (r, fs);}));

      // Missing file.
      //
      r.work.erase ("VERSION");
      assert (fails (failure::adapter, [&r, &fs] {read_version (r, fs);}));
    }

    return 0;
  }
}

int
main ()
{
  return prel::main ();
}
