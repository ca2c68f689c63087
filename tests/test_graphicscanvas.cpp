#include <gtest/gtest.h>
#include <wx/graphics.h>
#include <wx/image.h>
#include <wx/math.h>
#include <cmath>
#include <functional>
#include <memory>
#include "circularprogressdrawable.h"
#include "graphicscanvas.h"

namespace {

const int IMAGE_SIZE = 200;

// Point on a circle around the image center, angle in canvas degrees
wxPoint PointAt(double radius, double degrees)
{
    double rad = degrees * M_PI / 180.0;
    return wxPoint(static_cast<int>(std::lround(IMAGE_SIZE / 2 + radius * std::cos(rad))),
                   static_cast<int>(std::lround(IMAGE_SIZE / 2 + radius * std::sin(rad))));
}

bool IsBlue(const wxImage& image, const wxPoint& pt)
{
    return image.GetBlue(pt.x, pt.y) > 200 && image.GetRed(pt.x, pt.y) < 80;
}

bool IsWhite(const wxImage& image, const wxPoint& pt)
{
    return image.GetRed(pt.x, pt.y) > 200 && image.GetGreen(pt.x, pt.y) > 200;
}

}

class GraphicsContextCanvasTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_image.Create(IMAGE_SIZE, IMAGE_SIZE, false);
        m_image.SetRGB(wxRect(0, 0, IMAGE_SIZE, IMAGE_SIZE), 255, 255, 255);

        m_paint.style = PaintStyle::Stroke;
        m_paint.colour = wxColour(0, 0, 255);
        m_paint.strokeWidth = 10.0;
        m_paint.roundCap = false;
    }

    // Renders through a context bound to m_image, the pixels land when it is destroyed
    bool Render(const std::function<void(ProgressCanvas&)>& draw)
    {
        std::unique_ptr<wxGraphicsContext> gc(wxGraphicsContext::Create(m_image));
        if (!gc) {
            return false;
        }
        GraphicsContextCanvas canvas(gc.get());
        draw(canvas);
        return true;
    }

    wxImage m_image;
    ProgressPaint m_paint;
};

TEST_F(GraphicsContextCanvasTest, NegativeSweepRunsCounterClockwise)
{
    const wxRect2DDouble oval(20, 20, 160, 160);
    bool rendered = Render([&](ProgressCanvas& canvas) {
        canvas.DrawArc(oval, 89.0, -45.0, m_paint);
    });
    if (!rendered) {
        GTEST_SKIP() << "No wxGraphicsContext available for wxImage";
    }

    // From 89 back to 44 degrees: lower right quadrant only
    EXPECT_TRUE(IsBlue(m_image, PointAt(80, 66)));
    EXPECT_TRUE(IsWhite(m_image, PointAt(80, 112)));
    EXPECT_TRUE(IsWhite(m_image, PointAt(80, 269)));
}

TEST_F(GraphicsContextCanvasTest, PositiveSweepRunsClockwise)
{
    const wxRect2DDouble oval(20, 20, 160, 160);
    bool rendered = Render([&](ProgressCanvas& canvas) {
        canvas.DrawArc(oval, 89.0, 45.0, m_paint);
    });
    if (!rendered) {
        GTEST_SKIP() << "No wxGraphicsContext available for wxImage";
    }

    // From 89 on to 134 degrees: lower left quadrant only
    EXPECT_TRUE(IsBlue(m_image, PointAt(80, 112)));
    EXPECT_TRUE(IsWhite(m_image, PointAt(80, 66)));
}

TEST_F(GraphicsContextCanvasTest, FullSweepDrawsWholeRing)
{
    const wxRect2DDouble oval(20, 20, 160, 160);
    bool rendered = Render([&](ProgressCanvas& canvas) {
        canvas.DrawArc(oval, 89.0, -360.0, m_paint);
    });
    if (!rendered) {
        GTEST_SKIP() << "No wxGraphicsContext available for wxImage";
    }

    const double angles[] = { 0.0, 89.0, 180.0, 269.0 };
    for (double angle : angles) {
        EXPECT_TRUE(IsBlue(m_image, PointAt(80, angle))) << "angle " << angle;
    }
    EXPECT_TRUE(IsWhite(m_image, PointAt(40, 0)));
}

TEST_F(GraphicsContextCanvasTest, DeterminateDrawableFillsCounterClockwiseFromBottom)
{
    auto drawable = CircularProgressDrawable::Builder()
        .SetRingWidth(10)
        .SetOutlineColor(wxColour(128, 128, 128))
        .SetRingColor(wxColour(0, 0, 255))
        .SetCenterColor(wxColour(255, 255, 255))
        .Create();
    drawable->SetBounds(wxRect(0, 0, IMAGE_SIZE, IMAGE_SIZE));
    drawable->SetProgress(0.125f);

    bool rendered = Render([&](ProgressCanvas& canvas) {
        drawable->Draw(canvas);
    });
    if (!rendered) {
        GTEST_SKIP() << "No wxGraphicsContext available for wxImage";
    }

    // Ring radius is 95 - 10 / 2; an eighth of a turn ends at 44 degrees
    EXPECT_TRUE(IsBlue(m_image, PointAt(90, 66)));
    EXPECT_FALSE(IsBlue(m_image, PointAt(90, 112)));
    EXPECT_FALSE(IsBlue(m_image, PointAt(90, 0)));
}
