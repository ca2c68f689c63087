#ifndef PROGRESSCANVAS_H
#define PROGRESSCANVAS_H

#include <wx/wx.h>
#include <wx/geometry.h>
#include <functional>

enum class PaintStyle {
    Stroke,   // Outline only
    Fill      // Solid interior
};

/**
 * @brief Brush/pen state handed to a ProgressCanvas for a single draw call
 *
 * The drawable keeps one of these and overwrites its fields before each
 * shape, so a canvas must not keep a reference past the call.
 */
struct ProgressPaint {
    using ColorFilter = std::function<wxColour(const wxColour&)>;

    PaintStyle style;
    wxColour colour;
    double strokeWidth;
    bool roundCap;
    bool antiAlias;
    int alpha;                  // Global alpha 0-255, multiplies the colour's own alpha
    ColorFilter colorFilter;    // Optional, applied before alpha

    ProgressPaint()
        : style(PaintStyle::Fill)
        , colour(0, 0, 0)
        , strokeWidth(1.0)
        , roundCap(false)
        , antiAlias(true)
        , alpha(255)
        , colorFilter(nullptr)
    {}

    // Colour as it should hit the surface (filter, then alpha)
    wxColour ResolveColour() const;
};

/**
 * @brief Minimal 2D surface the progress drawable renders onto
 *
 * Angles are in degrees, 0 points to 3 o'clock and positive values run
 * clockwise on screen (y axis pointing down).
 */
class ProgressCanvas
{
public:
    virtual ~ProgressCanvas() = default;

    // Stroked or filled circle depending on paint.style
    virtual void DrawCircle(const wxPoint2DDouble& center, double radius, const ProgressPaint& paint) = 0;

    // Open circular arc inscribed in oval, from startAngle spanning sweepAngle (negative = counter-clockwise)
    virtual void DrawArc(const wxRect2DDouble& oval, double startAngle, double sweepAngle,
                         const ProgressPaint& paint) = 0;
};

#endif // PROGRESSCANVAS_H
