#include "progressdemoframe.h"
#include <cmath>

wxBEGIN_EVENT_TABLE(ProgressDemoFrame, wxFrame)
    EVT_TIMER(wxID_ANY, ProgressDemoFrame::OnTimer)
    EVT_CHAR_HOOK(ProgressDemoFrame::OnCharHook)
    EVT_CLOSE(ProgressDemoFrame::OnClose)
wxEND_EVENT_TABLE()

ProgressDemoFrame::ProgressDemoFrame(Settings* settings)
    : wxFrame(nullptr, wxID_ANY, wxT("Circular Progress"), wxDefaultPosition, wxSize(640, 360))
    , m_settings(settings)
    , m_levelPanel(nullptr)
    , m_spinnerPanel(nullptr)
    , m_timer(this)
    , m_level(0)
{
    SetupUI();

    m_timer.Start(m_settings->GetTickInterval());
    wxLogMessage("ProgressDemoFrame initialized: tick=%dms", m_settings->GetTickInterval());
}

ProgressDemoFrame::~ProgressDemoFrame()
{
    m_timer.Stop();
}

void ProgressDemoFrame::SetupUI()
{
    wxPanel* root = new wxPanel(this, wxID_ANY);
    root->SetBackgroundColour(wxColour(50, 50, 50));

    m_levelPanel = new CircularProgressPanel(root, m_settings->CreateBuilder().Create());
    m_levelPanel->SetBackgroundColour(root->GetBackgroundColour());

    std::unique_ptr<CircularProgressDrawable> spinner = m_settings->CreateBuilder().Create();
    spinner->SetIndeterminate(true);

    m_spinnerPanel = new CircularProgressPanel(root, std::move(spinner));
    m_spinnerPanel->SetBackgroundColour(root->GetBackgroundColour());

    wxBoxSizer* sizer = new wxBoxSizer(wxHORIZONTAL);
    sizer->Add(m_levelPanel, 1, wxEXPAND | wxALL, 16);
    sizer->Add(m_spinnerPanel, 1, wxEXPAND | wxALL, 16);
    root->SetSizer(sizer);
}

void ProgressDemoFrame::OnTimer(wxTimerEvent& event)
{
    wxUnusedVar(event);

    AdvanceDeterminate();
    AdvanceIndeterminate(m_spinnerPanel->GetDrawable());
}

void ProgressDemoFrame::AdvanceDeterminate()
{
    CircularProgressDrawable* drawable = m_levelPanel->GetDrawable();

    if (drawable->IsIndeterminate()) {
        AdvanceIndeterminate(drawable);
        return;
    }

    m_level += m_settings->GetLevelStep();
    if (m_level > CircularProgressDrawable::MAX_LEVEL) {
        m_level = 0;
    } else if (m_level < 0) {
        m_level = CircularProgressDrawable::MAX_LEVEL;
    }
    drawable->SetLevel(m_level);
}

void ProgressDemoFrame::AdvanceIndeterminate(CircularProgressDrawable* drawable)
{
    float angle = std::fmod(drawable->GetRawProgress() + m_settings->GetSpinStep(), 360.0f);
    drawable->SetProgress(angle);
}

void ProgressDemoFrame::OnCharHook(wxKeyEvent& event)
{
    switch (event.GetKeyCode()) {
    case WXK_ESCAPE:
        Close();
        break;

    case WXK_SPACE:
        if (m_timer.IsRunning()) {
            m_timer.Stop();
            wxLogMessage("Animation paused");
        } else {
            m_timer.Start(m_settings->GetTickInterval());
            wxLogMessage("Animation resumed");
        }
        break;

    case 'I': {
        CircularProgressDrawable* drawable = m_levelPanel->GetDrawable();
        bool indeterminate = !drawable->IsIndeterminate();
        drawable->SetIndeterminate(indeterminate);
        // Leaving the spinner restarts empty, resume from the current level
        if (indeterminate) {
            drawable->SetProgress(0.0f);
        } else {
            drawable->SetProgress(static_cast<float>(m_level) / CircularProgressDrawable::MAX_LEVEL);
        }
        wxLogMessage("Left indicator mode: %s", indeterminate ? "indeterminate" : "determinate");
        break;
    }

    default:
        event.Skip();
        break;
    }
}

void ProgressDemoFrame::OnClose(wxCloseEvent& event)
{
    wxLogMessage("ProgressDemoFrame: Closing application...");
    m_timer.Stop();
    m_settings->Save();
    event.Skip();
}
