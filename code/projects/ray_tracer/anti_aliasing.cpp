#include "anti_aliasing.hpp"
#include "shared/assert.hpp"

namespace RT::AntiAlias
{

vec2 RegularGridOffset( i32 iteration, i32 gridSize )
{
    RD_DBG_ASSERT( gridSize > 0 && iteration >= 0 );
    i32 col = iteration % gridSize;
    i32 row = ( iteration / gridSize ) % gridSize;
    return vec2( ( col + 0.5f ) / gridSize, ( row + 0.5f ) / gridSize );
}

i32 GetIterations( i32 gridSize ) { return gridSize * gridSize; }

} // namespace RT::AntiAlias
