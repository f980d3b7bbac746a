// file      : prel/version-file.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PREL_VERSION_FILE_HXX
#define PREL_VERSION_FILE_HXX

#include <regex>

#include <prel/types.hxx>
#include <prel/utility.hxx>

#include <prel/repository.hxx>

#include <prel/prel-options.hxx>

namespace prel
{
  // File that embeds the project version.
  //
  class version_file
  {
  public:
    enum kind_type
    {
      plain,     // Entire content is the version.
      formatted, // Entire content is the format with {version} substituted.
      pattern    // Edited in place, regex first capture group is the version.
    };

    path file;
    kind_type kind;
    string format; // Format or regex, empty for plain.

    // Throw invalid_argument if the format has no {version} placeholder or
    // the regex is invalid.
    //
    version_file (path, kind_type, string format = string ());

    // Return all the versions found in the content (normally just one).
    //
    strings
    versions (const string& content) const;

    // Return the content with the version replaced.
    //
    string
    rewrite (const string& content, const string& version) const;

  private:
    std::regex regex_;
  };

  using version_files = vector<version_file>;

  // Collect the version files from the options. Fail (configuration error)
  // if none are specified or any is invalid.
  //
  version_files
  parse_version_files (const options&);

  // Read the version from the files. Fail (version error) if it is missing,
  // empty, or differs between (or within) the files.
  //
  string
  read_version (repository&, const version_files&);

  // Write the version into all the files.
  //
  void
  write_version (repository&, const version_files&, const string&);

  strings
  version_paths (const version_files&);
}

#endif // PREL_VERSION_FILE_HXX
