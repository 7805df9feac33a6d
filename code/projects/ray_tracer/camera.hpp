#pragma once

#include "ray.hpp"

namespace RT
{

// Pinhole camera looking down +z in its local space, with +y up and +x right. The local frame is rotated
// into the world by rotationAngle degrees around rotationAxis. The image plane sits one unit in front of the camera.
class Camera
{
public:
    Camera();

    // recomputes the world space frame and image plane size. Call after changing any of the public members
    void Update();

    // x and y in [0, 1], with (0, 0) at the top left of the image
    vec3 ImagePlanePoint( f32 x, f32 y ) const;
    Ray GetRay( f32 x, f32 y ) const;

    vec3 GetRightDir() const { return m_right; }
    vec3 GetUpDir() const { return m_up; }
    vec3 GetForwardDir() const { return m_forward; }
    f32 GetImagePlaneWidth() const { return m_planeWidth; }
    f32 GetImagePlaneHeight() const { return m_planeHeight; }

    vec3 position     = vec3( 0 );
    vec3 rotationAxis = vec3( 0, 1, 0 );
    f32 rotationAngle = 0;                  // in degrees
    f32 vFov          = DegToRad( 60.0f ); // in radians
    f32 aspectRatio   = 1;                  // width / height

private:
    vec3 m_right;
    vec3 m_up;
    vec3 m_forward;
    f32 m_planeWidth;
    f32 m_planeHeight;
};

} // namespace RT
