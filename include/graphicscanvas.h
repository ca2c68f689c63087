#ifndef GRAPHICSCANVAS_H
#define GRAPHICSCANVAS_H

#include <wx/wx.h>
#include <wx/graphics.h>
#include "progresscanvas.h"

/**
 * @brief ProgressCanvas backed by a wxGraphicsContext (GDI+ / Cairo / CoreGraphics)
 *
 * Does not own the context; the caller keeps it alive for the lifetime of
 * the canvas (typically one paint event).
 */
class GraphicsContextCanvas : public ProgressCanvas
{
public:
    explicit GraphicsContextCanvas(wxGraphicsContext* gc);

    void DrawCircle(const wxPoint2DDouble& center, double radius, const ProgressPaint& paint) override;
    void DrawArc(const wxRect2DDouble& oval, double startAngle, double sweepAngle,
                 const ProgressPaint& paint) override;

private:
    void ApplyPaint(const ProgressPaint& paint);

    wxGraphicsContext* m_gc;
};

#endif // GRAPHICSCANVAS_H
