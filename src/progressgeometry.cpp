#include "progressgeometry.h"
#include <algorithm>

int MinSideSize(const wxRect& bounds)
{
    return std::min(bounds.GetWidth(), bounds.GetHeight());
}

ProgressGeometry ComputeProgressGeometry(const wxRect& bounds, int size, int ringWidth, float circleScale)
{
    ProgressGeometry geometry;

    double halfRingWidth = ringWidth / 2.0;

    geometry.size = size;
    geometry.outerRadius = std::max(0.0, size / 2.0 - halfRingWidth);
    geometry.innerRadius = geometry.outerRadius * circleScale;

    // Center the outer circle when the bounds are not square
    geometry.offsetX = (bounds.GetWidth() - geometry.outerRadius * 2) / 2;
    geometry.offsetY = (bounds.GetHeight() - geometry.outerRadius * 2) / 2;

    geometry.center = wxPoint2DDouble(bounds.GetX() + bounds.GetWidth() / 2.0,
                                      bounds.GetY() + bounds.GetHeight() / 2.0);

    // The arc stroke is centered on its path, keep it inside the outline circle
    double arcSide = std::max(0.0, geometry.outerRadius * 2 - ringWidth);
    geometry.arcBounds = wxRect2DDouble(bounds.GetX() + geometry.offsetX + halfRingWidth,
                                        bounds.GetY() + geometry.offsetY + halfRingWidth,
                                        arcSide,
                                        arcSide);

    return geometry;
}
