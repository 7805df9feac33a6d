#include "image.hpp"
#include "shared/assert.hpp"
#include "shared/filesystem.hpp"
#include "shared/logger.hpp"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb/stb_image_write.h"

namespace RT
{

static u8 UnormFloatToUChar( f32 x ) { return static_cast<u8>( Saturate( x ) * 255.0f + 0.5f ); }

FloatImage2D::FloatImage2D( u32 width, u32 height ) : m_width( width ), m_height( height ), m_pixels( width * height, vec3( 0 ) )
{
}

void FloatImage2D::SetPixel( u32 x, u32 y, const vec3& color )
{
    RD_DBG_ASSERT( x < m_width && y < m_height );
    m_pixels[y * m_width + x] = color;
}

vec3 FloatImage2D::GetPixel( u32 x, u32 y ) const
{
    RD_DBG_ASSERT( x < m_width && y < m_height );
    return m_pixels[y * m_width + x];
}

bool FloatImage2D::Save( const std::string& filename ) const
{
    if ( m_width == 0 || m_height == 0 )
    {
        LOG_ERR( "Cannot save empty image to '%s'", filename.c_str() );
        return false;
    }

    const i32 w           = static_cast<i32>( m_width );
    const i32 h           = static_cast<i32>( m_height );
    const i32 numChannels = 3;
    std::string ext       = GetFileExtension( filename );
    int ret               = 0;
    if ( ext == ".jpg" || ext == ".png" || ext == ".tga" || ext == ".bmp" )
    {
        std::vector<u8> ldrImage( m_pixels.size() * numChannels );
        for ( size_t i = 0; i < m_pixels.size(); ++i )
        {
            for ( i32 channel = 0; channel < numChannels; ++channel )
            {
                ldrImage[numChannels * i + channel] = UnormFloatToUChar( m_pixels[i][channel] );
            }
        }

        switch ( ext[1] )
        {
        case 'p': ret = stbi_write_png( filename.c_str(), w, h, numChannels, ldrImage.data(), w * numChannels ); break;
        case 'j': ret = stbi_write_jpg( filename.c_str(), w, h, numChannels, ldrImage.data(), 95 ); break;
        case 'b': ret = stbi_write_bmp( filename.c_str(), w, h, numChannels, ldrImage.data() ); break;
        case 't': ret = stbi_write_tga( filename.c_str(), w, h, numChannels, ldrImage.data() ); break;
        default: ret = 0;
        }
    }
    else if ( ext == ".hdr" )
    {
        ret = stbi_write_hdr( filename.c_str(), w, h, numChannels, reinterpret_cast<const f32*>( m_pixels.data() ) );
    }
    else
    {
        LOG_ERR( "Saving image as filetype '%s' is not supported", ext.c_str() );
        return false;
    }

    if ( ret == 0 )
    {
        LOG_ERR( "Could not save image to file '%s'", filename.c_str() );
        return false;
    }

    return true;
}

} // namespace RT
