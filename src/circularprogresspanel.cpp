#include "circularprogresspanel.h"
#include "graphicscanvas.h"
#include <wx/dcbuffer.h>
#include <wx/graphics.h>

wxBEGIN_EVENT_TABLE(CircularProgressPanel, wxPanel)
    EVT_PAINT(CircularProgressPanel::OnPaint)
    EVT_SIZE(CircularProgressPanel::OnSize)
wxEND_EVENT_TABLE()

CircularProgressPanel::CircularProgressPanel(wxWindow* parent, std::unique_ptr<CircularProgressDrawable> drawable)
    : wxPanel(parent, wxID_ANY)
    , m_drawable(std::move(drawable))
{
    // Required by wxBufferedPaintDC, we clear the background ourselves
    SetBackgroundStyle(wxBG_STYLE_PAINT);

    m_drawable->SetBounds(GetClientRect());
    m_drawable->OnInvalidate = [this]() {
        Refresh(false);  // false = don't erase background (handled in OnPaint)
    };
}

void CircularProgressPanel::OnPaint(wxPaintEvent& event)
{
    wxUnusedVar(event);

    wxBufferedPaintDC dc(this);
    dc.SetBackground(wxBrush(GetBackgroundColour()));
    dc.Clear();

    std::unique_ptr<wxGraphicsContext> gc(wxGraphicsContext::Create(dc));
    if (!gc) {
        wxLogWarning("CircularProgressPanel: could not create graphics context");
        return;
    }

    GraphicsContextCanvas canvas(gc.get());
    m_drawable->Draw(canvas);
}

void CircularProgressPanel::OnSize(wxSizeEvent& event)
{
    m_drawable->SetBounds(GetClientRect());
    Refresh(false);
    event.Skip();
}
