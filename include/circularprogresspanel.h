#ifndef CIRCULARPROGRESSPANEL_H
#define CIRCULARPROGRESSPANEL_H

#include <wx/wx.h>
#include <memory>
#include "circularprogressdrawable.h"

/**
 * @brief wxPanel hosting a single CircularProgressDrawable
 *
 * Supplies the client rectangle as the drawable bounds, turns redraw
 * requests into Refresh() and paints through a wxGraphicsContext.
 */
class CircularProgressPanel : public wxPanel
{
public:
    CircularProgressPanel(wxWindow* parent, std::unique_ptr<CircularProgressDrawable> drawable);

    CircularProgressDrawable* GetDrawable() { return m_drawable.get(); }

protected:
    void OnPaint(wxPaintEvent& event);
    void OnSize(wxSizeEvent& event);

private:
    std::unique_ptr<CircularProgressDrawable> m_drawable;

    wxDECLARE_EVENT_TABLE();
};

#endif // CIRCULARPROGRESSPANEL_H
