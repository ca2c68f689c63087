#include "progresscanvas.h"
#include <algorithm>

wxColour ProgressPaint::ResolveColour() const
{
    wxColour resolved = colorFilter ? colorFilter(colour) : colour;

    int globalAlpha = std::max(0, std::min(255, alpha));
    unsigned char combined = static_cast<unsigned char>(resolved.Alpha() * globalAlpha / 255);

    return wxColour(resolved.Red(), resolved.Green(), resolved.Blue(), combined);
}
