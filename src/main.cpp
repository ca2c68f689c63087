#include <wx/wx.h>
#include <cstdio>
#include <memory>
#include "settings.h"
#include "progressdemoframe.h"

/**
 * @brief Main wxWidgets application class
 */
class CircularProgressApp : public wxApp
{
public:
    virtual bool OnInit() override;
    virtual int OnExit() override;

private:
    std::unique_ptr<Settings> m_settings;
};

wxIMPLEMENT_APP(CircularProgressApp);

bool CircularProgressApp::OnInit()
{
    SetAppName(wxT("CircularProgress"));

    // Create log file in current directory
    wxLog::SetActiveTarget(new wxLogStderr());
    FILE* logFile = fopen("circularprogress_debug.log", "w");
    if (logFile) {
        delete wxLog::SetActiveTarget(new wxLogStderr(logFile));
    }

    wxLogMessage("=== Circular Progress - Starting ===");

    m_settings.reset(new Settings());

    ProgressDemoFrame* frame = new ProgressDemoFrame(m_settings.get());
    frame->Show(true);

    wxLogMessage("");
    wxLogMessage("=== Keyboard Shortcuts ===");
    wxLogMessage("SPACE - Pause/resume animation");
    wxLogMessage("I - Toggle determinate/indeterminate on the left indicator");
    wxLogMessage("ESC - Exit application");
    wxLogMessage("");
    wxLogMessage("=== Application Ready ===");

    return true;
}

int CircularProgressApp::OnExit()
{
    wxLogMessage("Circular Progress exiting...");
    m_settings.reset();
    return wxApp::OnExit();
}
