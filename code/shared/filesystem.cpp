#include "shared/filesystem.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

std::string BackToForwardSlashes( std::string str )
{
    std::replace( str.begin(), str.end(), '\\', '/' );
    return str;
}

bool IsFile( const std::string& path ) { return fs::is_regular_file( path ); }

std::string GetFileExtension( const std::string& filename )
{
    std::string ext = fs::path( filename ).extension().string();
    for ( size_t i = 0; i < ext.length(); ++i )
    {
        ext[i] = static_cast<char>( std::tolower( ext[i] ) );
    }

    return ext;
}

std::string GetParentPath( std::string path )
{
    if ( path.empty() )
    {
        return "";
    }

    path[path.length() - 1] = ' ';
    std::string parent      = fs::path( path ).parent_path().string();
    if ( parent.length() )
    {
        parent += '/';
    }
    parent = BackToForwardSlashes( parent );

    return parent;
}

std::string ResolvePath( const std::string& path, const std::string& searchDir0, const std::string& searchDir1 )
{
    if ( fs::path( path ).is_absolute() || IsFile( path ) )
    {
        return IsFile( path ) ? path : "";
    }

    for ( const std::string* dir : { &searchDir0, &searchDir1 } )
    {
        if ( !dir->empty() && IsFile( *dir + path ) )
        {
            return *dir + path;
        }
    }

    return "";
}
