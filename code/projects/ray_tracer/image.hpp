#pragma once

#include "shared/math_vec.hpp"
#include <string>
#include <vector>

namespace RT
{

// Destination of a render. (0, 0) is the top left pixel
class ImageSink
{
public:
    virtual ~ImageSink() = default;

    virtual u32 Width() const                                 = 0;
    virtual u32 Height() const                                = 0;
    virtual void SetPixel( u32 x, u32 y, const vec3& color ) = 0;
};

// Linear, unclamped RGB
class FloatImage2D : public ImageSink
{
public:
    FloatImage2D() = default;
    FloatImage2D( u32 width, u32 height );

    u32 Width() const override { return m_width; }
    u32 Height() const override { return m_height; }
    void SetPixel( u32 x, u32 y, const vec3& color ) override;
    vec3 GetPixel( u32 x, u32 y ) const;

    // .hdr files keep the raw values. .png, .jpg, .bmp and .tga are saturated to [0, 1] and quantized
    bool Save( const std::string& filename ) const;

private:
    u32 m_width  = 0;
    u32 m_height = 0;
    std::vector<vec3> m_pixels;
};

} // namespace RT
