#pragma once

#include <string>

std::string BackToForwardSlashes( std::string str );

bool IsFile( const std::string& path );

// Returns the last extension on a filename, including the period, lowercased.
// Ex: /foo/bar/baz.log.TXT -> .txt
std::string GetFileExtension( const std::string& filename );

// Returns everything before the filename and extension, with an ending forward slash
// Ex: /foo/bar/baz.log.TXT -> /foo/bar/
// Ex: /foo/bar/baz/ -> /foo/bar/
std::string GetParentPath( std::string path );

// Returns path if it names an existing file. Relative paths that don't are tried against each
// search directory in order. Returns an empty string if nothing matched
std::string ResolvePath( const std::string& path, const std::string& searchDir0, const std::string& searchDir1 = "" );
