#include "camera.hpp"
#include <cmath>

namespace RT
{

// Rodrigues' rotation of v around the unit axis k
static vec3 RotateAroundAxis( const vec3& v, const vec3& k, f32 cosTheta, f32 sinTheta )
{
    return v * cosTheta + Cross( k, v ) * sinTheta + k * Dot( k, v ) * ( 1 - cosTheta );
}

Camera::Camera() { Update(); }

void Camera::Update()
{
    m_planeHeight = 2 * std::tan( vFov / 2 );
    m_planeWidth  = m_planeHeight * aspectRatio;

    m_right   = vec3( 1, 0, 0 );
    m_up      = vec3( 0, 1, 0 );
    m_forward = vec3( 0, 0, 1 );

    vec3 axis = NormalizeSafe( rotationAxis );
    if ( axis == vec3( 0 ) )
    {
        return;
    }

    // the sine is rebuilt from the cosine, which loses the sign. Wrapping first makes the sign of the
    // angle match the sign of its sine
    f32 angle    = WrapDegrees( rotationAngle );
    f32 cosTheta = std::cos( DegToRad( angle ) );
    f32 sinTheta = std::sqrt( Max( 0.0f, 1 - cosTheta * cosTheta ) );
    if ( angle < 0 )
    {
        sinTheta = -sinTheta;
    }

    m_right   = RotateAroundAxis( m_right, axis, cosTheta, sinTheta );
    m_up      = RotateAroundAxis( m_up, axis, cosTheta, sinTheta );
    m_forward = RotateAroundAxis( m_forward, axis, cosTheta, sinTheta );
}

vec3 Camera::ImagePlanePoint( f32 x, f32 y ) const
{
    return position + ( x - 0.5f ) * m_planeWidth * m_right + ( 0.5f - y ) * m_planeHeight * m_up + m_forward;
}

Ray Camera::GetRay( f32 x, f32 y ) const { return Ray( position, Normalize( ImagePlanePoint( x, y ) - position ) ); }

} // namespace RT
