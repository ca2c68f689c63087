#ifndef PROGRESSDEMOFRAME_H
#define PROGRESSDEMOFRAME_H

#include <wx/wx.h>
#include <wx/timer.h>
#include "circularprogresspanel.h"
#include "settings.h"

/**
 * @brief Demo window with a determinate and an indeterminate progress indicator
 *
 * Features:
 * - Left panel fills through the level signal (0-10000), wrapping when full
 * - Right panel spins a 90° arc by advancing its start angle
 * - Space pauses/resumes the timer, I toggles the left panel's mode, ESC closes
 */
class ProgressDemoFrame : public wxFrame
{
public:
    explicit ProgressDemoFrame(Settings* settings);
    ~ProgressDemoFrame();

protected:
    void OnTimer(wxTimerEvent& event);
    void OnCharHook(wxKeyEvent& event);
    void OnClose(wxCloseEvent& event);

private:
    void SetupUI();
    void AdvanceDeterminate();
    void AdvanceIndeterminate(CircularProgressDrawable* drawable);

    Settings* m_settings;
    CircularProgressPanel* m_levelPanel;
    CircularProgressPanel* m_spinnerPanel;
    wxTimer m_timer;
    int m_level;

    wxDECLARE_EVENT_TABLE();
};

#endif // PROGRESSDEMOFRAME_H
