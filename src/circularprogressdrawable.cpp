#include "circularprogressdrawable.h"
#include <algorithm>
#include <utility>

const int CircularProgressDrawable::PROGRESS_FACTOR;
const int CircularProgressDrawable::MAX_LEVEL;
const float CircularProgressDrawable::DETERMINATE_START_ANGLE = 89.0f;
const float CircularProgressDrawable::INDETERMINATE_SWEEP_ANGLE = 90.0f;
const float CircularProgressDrawable::DEFAULT_CIRCLE_SCALE = 0.75f;

CircularProgressDrawable::CircularProgressDrawable(int ringWidth, float circleScale,
                                                   const wxColour& outlineColor,
                                                   const wxColour& ringColor,
                                                   const wxColour& centerColor,
                                                   SizeResolver sizeResolver,
                                                   LevelAdapter levelAdapter)
    : OnInvalidate(nullptr)
    , m_paint()
    , m_bounds(0, 0, 0, 0)
    , m_progress(0.0f)
    , m_level(0)
    , m_outlineColor(outlineColor)
    , m_ringColor(ringColor)
    , m_centerColor(centerColor)
    , m_ringWidth(ringWidth)
    , m_circleScale(circleScale)
    , m_indeterminate(false)
    , m_sizeResolver(std::move(sizeResolver))
    , m_levelAdapter(std::move(levelAdapter))
{
    m_paint.antiAlias = true;
}

ProgressGeometry CircularProgressDrawable::GetGeometry() const
{
    int size = m_sizeResolver ? m_sizeResolver(m_bounds) : MinSideSize(m_bounds);
    return ComputeProgressGeometry(m_bounds, size, m_ringWidth, m_circleScale);
}

void CircularProgressDrawable::Draw(ProgressCanvas& canvas)
{
    const ProgressGeometry geometry = GetGeometry();

    // Outline circle
    m_paint.style = PaintStyle::Stroke;
    m_paint.strokeWidth = 1.0;
    m_paint.roundCap = false;
    m_paint.colour = m_outlineColor;
    canvas.DrawCircle(geometry.center, geometry.outerRadius, m_paint);

    // Inner circle
    m_paint.style = PaintStyle::Fill;
    m_paint.colour = m_centerColor;
    canvas.DrawCircle(geometry.center, geometry.innerRadius, m_paint);

    // Progress ring, drawn last so it overlays the outline
    m_paint.style = PaintStyle::Stroke;
    m_paint.strokeWidth = m_ringWidth;
    m_paint.roundCap = true;
    m_paint.colour = m_ringColor;
    canvas.DrawArc(geometry.arcBounds, GetArcStartAngle(), GetArcSweepAngle(), m_paint);
}

float CircularProgressDrawable::GetProgress() const
{
    return m_progress / PROGRESS_FACTOR;
}

void CircularProgressDrawable::SetProgress(float progress)
{
    if (m_indeterminate) {
        m_progress = progress;
    } else {
        m_progress = PROGRESS_FACTOR * std::max(0.0f, std::min(1.0f, progress));
    }
    Invalidate();
}

bool CircularProgressDrawable::SetLevel(int level)
{
    level = std::max(0, std::min(MAX_LEVEL, level));
    if (level == m_level) {
        return false;
    }

    m_level = level;
    float progress = m_levelAdapter ? m_levelAdapter(level) : static_cast<float>(level) / MAX_LEVEL;
    SetProgress(progress);
    return true;
}

float CircularProgressDrawable::GetArcStartAngle() const
{
    return m_indeterminate ? m_progress : DETERMINATE_START_ANGLE;
}

float CircularProgressDrawable::GetArcSweepAngle() const
{
    return m_indeterminate ? INDETERMINATE_SWEEP_ANGLE : m_progress;
}

void CircularProgressDrawable::SetCircleScale(float circleScale)
{
    m_circleScale = std::max(0.0f, circleScale);
    Invalidate();
}

void CircularProgressDrawable::SetIndeterminate(bool indeterminate)
{
    // A spinner start angle is not a valid determinate sweep, restart empty
    if (m_indeterminate && !indeterminate) {
        m_progress = 0.0f;
    }
    m_indeterminate = indeterminate;
    Invalidate();
}

void CircularProgressDrawable::SetOutlineColor(const wxColour& outlineColor)
{
    m_outlineColor = outlineColor;
    Invalidate();
}

void CircularProgressDrawable::SetRingColor(const wxColour& ringColor)
{
    m_ringColor = ringColor;
    Invalidate();
}

void CircularProgressDrawable::SetCenterColor(const wxColour& centerColor)
{
    m_centerColor = centerColor;
    Invalidate();
}

void CircularProgressDrawable::SetAlpha(int alpha)
{
    m_paint.alpha = std::max(0, std::min(255, alpha));
    Invalidate();
}

int CircularProgressDrawable::GetOpacity() const
{
    return m_paint.alpha;
}

void CircularProgressDrawable::SetColorFilter(const ProgressPaint::ColorFilter& filter)
{
    m_paint.colorFilter = filter;
    Invalidate();
}

void CircularProgressDrawable::Invalidate()
{
    if (OnInvalidate) {
        OnInvalidate();
    }
}

// Builder

CircularProgressDrawable::Builder::Builder()
    : m_ringWidth(0)
    , m_outlineColor(wxTransparentColour)
    , m_ringColor(wxTransparentColour)
    , m_centerColor(wxTransparentColour)
    , m_circleScale(DEFAULT_CIRCLE_SCALE)
    , m_size(0)
    , m_sizeResolver(nullptr)
    , m_levelAdapter(nullptr)
{
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetRingWidth(int ringWidth)
{
    m_ringWidth = ringWidth;
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetOutlineColor(const wxColour& outlineColor)
{
    m_outlineColor = outlineColor;
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetRingColor(const wxColour& ringColor)
{
    m_ringColor = ringColor;
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetCenterColor(const wxColour& centerColor)
{
    m_centerColor = centerColor;
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetInnerCircleScale(float circleScale)
{
    m_circleScale = circleScale;
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetSize(int size)
{
    m_size = size;
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetSizeResolver(SizeResolver resolver)
{
    m_sizeResolver = std::move(resolver);
    return *this;
}

CircularProgressDrawable::Builder& CircularProgressDrawable::Builder::SetLevelAdapter(LevelAdapter adapter)
{
    m_levelAdapter = std::move(adapter);
    return *this;
}

std::unique_ptr<CircularProgressDrawable> CircularProgressDrawable::Builder::Create() const
{
    int ringWidth = m_ringWidth;
    if (ringWidth < 0) {
        wxLogWarning("CircularProgressDrawable: negative ring width %d, using 0", ringWidth);
        ringWidth = 0;
    }

    float circleScale = m_circleScale;
    if (circleScale < 0.0f) {
        wxLogWarning("CircularProgressDrawable: negative inner circle scale %.2f, using 0", circleScale);
        circleScale = 0.0f;
    }

    // A fixed size wins over any resolver, matching SetSize() semantics
    SizeResolver resolver = m_sizeResolver;
    if (m_size > 0) {
        int fixedSize = m_size;
        resolver = [fixedSize](const wxRect&) { return fixedSize; };
    } else if (!resolver) {
        resolver = MinSideSize;
    }

    LevelAdapter adapter = m_levelAdapter;
    if (!adapter) {
        adapter = [](int level) { return static_cast<float>(level) / MAX_LEVEL; };
    }

    return std::unique_ptr<CircularProgressDrawable>(new CircularProgressDrawable(
        ringWidth, circleScale, m_outlineColor, m_ringColor, m_centerColor, resolver, adapter));
}
