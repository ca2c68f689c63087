#ifndef CIRCULARPROGRESSDRAWABLE_H
#define CIRCULARPROGRESSDRAWABLE_H

#include <wx/wx.h>
#include <functional>
#include <memory>
#include "progresscanvas.h"
#include "progressgeometry.h"

/**
 * @brief Circular progress indicator: filled inner circle, outline ring and progress arc
 *
 * Features:
 * - Determinate mode: the arc fills from 89° as progress goes from 0 to 1
 * - Indeterminate mode: a 90° arc whose start angle is the raw progress value,
 *   so a host timer can spin it by feeding increasing angles
 * - Independent colours for the outline, the ring and the center
 * - Optional fixed size and level (0-10000) input through pluggable strategies
 *
 * The drawable never schedules anything itself: each setter fires
 * OnInvalidate once and the host decides when to call Draw().
 */
class CircularProgressDrawable
{
public:
    // Converts the public [0..1] progress into arc degrees
    static const int PROGRESS_FACTOR = -360;
    static const int MAX_LEVEL = 10000;
    static const float DETERMINATE_START_ANGLE;
    static const float INDETERMINATE_SWEEP_ANGLE;
    static const float DEFAULT_CIRCLE_SCALE;

    // Resolves the drawing size from the current bounds
    using SizeResolver = std::function<int(const wxRect& bounds)>;
    // Maps a level signal (0..MAX_LEVEL) to a SetProgress() value
    using LevelAdapter = std::function<float(int level)>;

    class Builder;

    // Rendering
    void Draw(ProgressCanvas& canvas);
    ProgressGeometry GetGeometry() const;

    // Bounds are owned by the host layout, read on every draw
    void SetBounds(const wxRect& bounds) { m_bounds = bounds; }
    const wxRect& GetBounds() const { return m_bounds; }

    // Progress
    float GetProgress() const;
    void SetProgress(float progress);
    float GetRawProgress() const { return m_progress; }

    // Level signal, returns false when the level did not change
    bool SetLevel(int level);
    int GetLevel() const { return m_level; }

    // Arc policy for the current mode
    float GetArcStartAngle() const;
    float GetArcSweepAngle() const;

    float GetCircleScale() const { return m_circleScale; }
    void SetCircleScale(float circleScale);

    bool IsIndeterminate() const { return m_indeterminate; }
    void SetIndeterminate(bool indeterminate);

    int GetRingWidth() const { return m_ringWidth; }

    // Colours
    wxColour GetOutlineColor() const { return m_outlineColor; }
    wxColour GetRingColor() const { return m_ringColor; }
    wxColour GetCenterColor() const { return m_centerColor; }
    void SetOutlineColor(const wxColour& outlineColor);
    void SetRingColor(const wxColour& ringColor);
    void SetCenterColor(const wxColour& centerColor);

    // Paint passthrough
    void SetAlpha(int alpha);
    int GetAlpha() const { return m_paint.alpha; }
    int GetOpacity() const;
    void SetColorFilter(const ProgressPaint::ColorFilter& filter);

    // Redraw request sink, fired once per mutating call
    std::function<void()> OnInvalidate;

private:
    CircularProgressDrawable(int ringWidth, float circleScale,
                             const wxColour& outlineColor, const wxColour& ringColor, const wxColour& centerColor,
                             SizeResolver sizeResolver, LevelAdapter levelAdapter);

    void Invalidate();

    ProgressPaint m_paint;      // Scratch paint, overwritten before each shape
    wxRect m_bounds;
    float m_progress;           // Determinate: [-360..0] degrees, indeterminate: start angle
    int m_level;
    wxColour m_outlineColor;
    wxColour m_ringColor;
    wxColour m_centerColor;
    const int m_ringWidth;
    float m_circleScale;
    bool m_indeterminate;
    SizeResolver m_sizeResolver;
    LevelAdapter m_levelAdapter;
};

/**
 * @brief Collects construction parameters for a CircularProgressDrawable
 *
 * Every setter returns the builder so calls can be chained:
 * @code
 * auto drawable = CircularProgressDrawable::Builder()
 *     .SetRingWidth(10)
 *     .SetRingColor(*wxBLUE)
 *     .Create();
 * @endcode
 */
class CircularProgressDrawable::Builder
{
public:
    Builder();

    Builder& SetRingWidth(int ringWidth);
    Builder& SetOutlineColor(const wxColour& outlineColor);
    Builder& SetRingColor(const wxColour& ringColor);
    Builder& SetCenterColor(const wxColour& centerColor);
    Builder& SetInnerCircleScale(float circleScale);   // Defaults to 0.75
    Builder& SetSize(int size);                        // <= 0 fills the bounds
    Builder& SetSizeResolver(SizeResolver resolver);
    Builder& SetLevelAdapter(LevelAdapter adapter);

    std::unique_ptr<CircularProgressDrawable> Create() const;

private:
    int m_ringWidth;
    wxColour m_outlineColor;
    wxColour m_ringColor;
    wxColour m_centerColor;
    float m_circleScale;
    int m_size;
    SizeResolver m_sizeResolver;
    LevelAdapter m_levelAdapter;
};

#endif // CIRCULARPROGRESSDRAWABLE_H
