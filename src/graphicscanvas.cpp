#include "graphicscanvas.h"
#include <wx/math.h>
#include <algorithm>
#include <cmath>

GraphicsContextCanvas::GraphicsContextCanvas(wxGraphicsContext* gc)
    : m_gc(gc)
{
}

void GraphicsContextCanvas::ApplyPaint(const ProgressPaint& paint)
{
    wxColour colour = paint.ResolveColour();

    m_gc->SetAntialiasMode(paint.antiAlias ? wxANTIALIAS_DEFAULT : wxANTIALIAS_NONE);

    if (paint.style == PaintStyle::Stroke) {
        wxGraphicsPenInfo penInfo(colour, paint.strokeWidth);
        penInfo.Cap(paint.roundCap ? wxCAP_ROUND : wxCAP_BUTT);
        m_gc->SetPen(m_gc->CreatePen(penInfo));
        m_gc->SetBrush(*wxTRANSPARENT_BRUSH);
    } else {
        m_gc->SetPen(*wxTRANSPARENT_PEN);
        m_gc->SetBrush(wxBrush(colour));
    }
}

void GraphicsContextCanvas::DrawCircle(const wxPoint2DDouble& center, double radius, const ProgressPaint& paint)
{
    if (!m_gc || radius <= 0.0) return;

    ApplyPaint(paint);
    m_gc->DrawEllipse(center.m_x - radius, center.m_y - radius, radius * 2, radius * 2);
}

void GraphicsContextCanvas::DrawArc(const wxRect2DDouble& oval, double startAngle, double sweepAngle,
                                    const ProgressPaint& paint)
{
    if (!m_gc || oval.m_width <= 0.0 || oval.m_height <= 0.0 || sweepAngle == 0.0) return;

    ApplyPaint(paint);

    // Arc boxes are square, a non-square box gets the inscribed circle
    double cx = oval.m_x + oval.m_width / 2;
    double cy = oval.m_y + oval.m_height / 2;
    double r = std::min(oval.m_width, oval.m_height) / 2;

    wxGraphicsPath path = m_gc->CreatePath();
    if (std::fabs(sweepAngle) >= 360.0) {
        path.AddCircle(cx, cy, r);
    } else {
        double start = wxDegToRad(startAngle);
        double end = wxDegToRad(startAngle + sweepAngle);
        path.AddArc(cx, cy, r, start, end, sweepAngle > 0.0);
    }

    m_gc->StrokePath(path);
}
