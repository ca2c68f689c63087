#ifndef PROGRESSGEOMETRY_H
#define PROGRESSGEOMETRY_H

#include <wx/wx.h>
#include <wx/geometry.h>

/**
 * @brief Layout of the three progress elements for one set of bounds
 *
 * - outline circle: center / outerRadius
 * - inner circle:   center / innerRadius
 * - progress arc:   arcBounds (outer circle box inset by half the ring width)
 */
struct ProgressGeometry {
    double size;            // Effective drawing size (min side or fixed size)
    double outerRadius;
    double innerRadius;
    double offsetX;         // Offset of the outer circle box inside bounds
    double offsetY;
    wxPoint2DDouble center;
    wxRect2DDouble arcBounds;

    ProgressGeometry()
        : size(0.0)
        , outerRadius(0.0)
        , innerRadius(0.0)
        , offsetX(0.0)
        , offsetY(0.0)
        , center(0.0, 0.0)
        , arcBounds(0.0, 0.0, 0.0, 0.0)
    {}
};

// Size used when nothing overrides it: the shorter side of the bounds
int MinSideSize(const wxRect& bounds);

// Radii clamp at zero, so an oversized ring collapses instead of inverting
ProgressGeometry ComputeProgressGeometry(const wxRect& bounds, int size, int ringWidth, float circleScale);

#endif // PROGRESSGEOMETRY_H
