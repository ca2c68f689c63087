#ifndef RECORDINGCANVAS_H
#define RECORDINGCANVAS_H

#include <vector>
#include "progresscanvas.h"

/**
 * @brief ProgressCanvas that records every call instead of drawing
 */
class RecordingCanvas : public ProgressCanvas
{
public:
    enum class Shape { Circle, Arc };

    struct Call {
        Shape shape;
        wxPoint2DDouble center;     // Circle only
        double radius;              // Circle only
        wxRect2DDouble oval;        // Arc only
        double startAngle;          // Arc only
        double sweepAngle;          // Arc only
        PaintStyle style;
        wxColour colour;            // Resolved (filter + alpha applied)
        double strokeWidth;
        bool roundCap;
    };

    void DrawCircle(const wxPoint2DDouble& center, double radius, const ProgressPaint& paint) override
    {
        Call call = Record(Shape::Circle, paint);
        call.center = center;
        call.radius = radius;
        m_calls.push_back(call);
    }

    void DrawArc(const wxRect2DDouble& oval, double startAngle, double sweepAngle,
                 const ProgressPaint& paint) override
    {
        Call call = Record(Shape::Arc, paint);
        call.oval = oval;
        call.startAngle = startAngle;
        call.sweepAngle = sweepAngle;
        m_calls.push_back(call);
    }

    const std::vector<Call>& GetCalls() const { return m_calls; }
    void Clear() { m_calls.clear(); }

private:
    static Call Record(Shape shape, const ProgressPaint& paint)
    {
        Call call;
        call.shape = shape;
        call.center = wxPoint2DDouble(0, 0);
        call.radius = 0.0;
        call.oval = wxRect2DDouble(0, 0, 0, 0);
        call.startAngle = 0.0;
        call.sweepAngle = 0.0;
        call.style = paint.style;
        call.colour = paint.ResolveColour();
        call.strokeWidth = paint.strokeWidth;
        call.roundCap = paint.roundCap;
        return call;
    }

    std::vector<Call> m_calls;
};

#endif // RECORDINGCANVAS_H
