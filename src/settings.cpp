#include "settings.h"
#include <wx/stdpaths.h>
#include <wx/filename.h>

namespace {

const int DEFAULT_RING_WIDTH = 10;
const double DEFAULT_INNER_CIRCLE_SCALE = 0.75;
const int DEFAULT_SIZE = 0;
const wxString DEFAULT_OUTLINE_COLOR = wxT("#A0A0A0");
const wxString DEFAULT_RING_COLOR = wxT("#0096FF");
const wxString DEFAULT_CENTER_COLOR = wxT("#FFFFFF");
const int DEFAULT_TICK_INTERVAL = 16;
const int DEFAULT_LEVEL_STEP = 50;
const double DEFAULT_SPIN_STEP = 6.0;

wxString DefaultConfigPath()
{
    // Get user config directory (AppData\Roaming\CircularProgress on Windows)
    wxStandardPaths& paths = wxStandardPaths::Get();
    wxString configDir = paths.GetUserDataDir();

    // Create directory if it doesn't exist
    if (!wxDirExists(configDir)) {
        if (!wxFileName::Mkdir(configDir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
            wxLogWarning("Could not create config directory: %s", configDir);
        }
    }

    return configDir + wxFileName::GetPathSeparator() + wxT("config.ini");
}

}

Settings::Settings()
    : Settings(DefaultConfigPath())
{
}

Settings::Settings(const wxString& configPath)
    : m_configPath(configPath)
    , m_config(nullptr)
    , m_ringWidth(DEFAULT_RING_WIDTH)
    , m_innerCircleScale(static_cast<float>(DEFAULT_INNER_CIRCLE_SCALE))
    , m_size(DEFAULT_SIZE)
    , m_outlineColor(DEFAULT_OUTLINE_COLOR)
    , m_ringColor(DEFAULT_RING_COLOR)
    , m_centerColor(DEFAULT_CENTER_COLOR)
    , m_tickInterval(DEFAULT_TICK_INTERVAL)
    , m_levelStep(DEFAULT_LEVEL_STEP)
    , m_spinStep(static_cast<float>(DEFAULT_SPIN_STEP))
{
    Open();
    Load();
}

Settings::~Settings() = default;

void Settings::Open()
{
    // Create config object (uses INI format)
    m_config.reset(new wxFileConfig(
        wxT("CircularProgress"),  // App name
        wxEmptyString,            // Vendor name
        m_configPath,             // Local file
        wxEmptyString,            // Global file (none)
        wxCONFIG_USE_LOCAL_FILE
    ));

    wxLogMessage("Config file: %s", m_configPath);
}

wxColour Settings::ReadColour(const wxString& key, const wxString& fallback) const
{
    wxString value = m_config->Read(key, fallback);

    wxColour colour;
    if (!colour.Set(value)) {
        wxLogWarning("Invalid colour '%s' for %s, using %s", value, key, fallback);
        return wxColour(fallback);
    }
    return colour;
}

void Settings::Load()
{
    if (!m_config) return;

    // Drawable
    m_ringWidth = m_config->ReadLong(wxT("/progress/ring_width"), DEFAULT_RING_WIDTH);
    m_innerCircleScale = (float)m_config->ReadDouble(wxT("/progress/inner_circle_scale"), DEFAULT_INNER_CIRCLE_SCALE);
    m_size = m_config->ReadLong(wxT("/progress/size"), DEFAULT_SIZE);
    m_outlineColor = ReadColour(wxT("/progress/outline_color"), DEFAULT_OUTLINE_COLOR);
    m_ringColor = ReadColour(wxT("/progress/ring_color"), DEFAULT_RING_COLOR);
    m_centerColor = ReadColour(wxT("/progress/center_color"), DEFAULT_CENTER_COLOR);

    // Demo animation
    m_tickInterval = m_config->ReadLong(wxT("/demo/tick_interval"), DEFAULT_TICK_INTERVAL);
    m_levelStep = m_config->ReadLong(wxT("/demo/level_step"), DEFAULT_LEVEL_STEP);
    m_spinStep = (float)m_config->ReadDouble(wxT("/demo/spin_step"), DEFAULT_SPIN_STEP);

    if (m_tickInterval <= 0) {
        wxLogWarning("Invalid tick interval %dms, using %dms", m_tickInterval, DEFAULT_TICK_INTERVAL);
        m_tickInterval = DEFAULT_TICK_INTERVAL;
    }

    if (m_levelStep <= 0) {
        wxLogWarning("Invalid level step %d, using %d", m_levelStep, DEFAULT_LEVEL_STEP);
        m_levelStep = DEFAULT_LEVEL_STEP;
    }

    wxLogMessage("Settings loaded: ring=%d, scale=%.2f, size=%d, colors=(%s,%s,%s), tick=%dms, level step=%d, spin=%.1f",
                 m_ringWidth, m_innerCircleScale, m_size,
                 m_outlineColor.GetAsString(wxC2S_HTML_SYNTAX),
                 m_ringColor.GetAsString(wxC2S_HTML_SYNTAX),
                 m_centerColor.GetAsString(wxC2S_HTML_SYNTAX),
                 m_tickInterval, m_levelStep, m_spinStep);
}

void Settings::Save()
{
    if (!m_config) return;

    // Drawable
    m_config->Write(wxT("/progress/ring_width"), (long)m_ringWidth);
    m_config->Write(wxT("/progress/inner_circle_scale"), (double)m_innerCircleScale);
    m_config->Write(wxT("/progress/size"), (long)m_size);
    m_config->Write(wxT("/progress/outline_color"), m_outlineColor.GetAsString(wxC2S_HTML_SYNTAX));
    m_config->Write(wxT("/progress/ring_color"), m_ringColor.GetAsString(wxC2S_HTML_SYNTAX));
    m_config->Write(wxT("/progress/center_color"), m_centerColor.GetAsString(wxC2S_HTML_SYNTAX));

    // Demo animation
    m_config->Write(wxT("/demo/tick_interval"), (long)m_tickInterval);
    m_config->Write(wxT("/demo/level_step"), (long)m_levelStep);
    m_config->Write(wxT("/demo/spin_step"), (double)m_spinStep);

    // Flush to disk
    if (!m_config->Flush()) {
        wxLogWarning("Failed to write settings to: %s", m_configPath);
        return;
    }

    wxLogMessage("Settings saved to: %s", m_configPath);
}

CircularProgressDrawable::Builder Settings::CreateBuilder() const
{
    CircularProgressDrawable::Builder builder;
    builder.SetRingWidth(m_ringWidth)
           .SetInnerCircleScale(m_innerCircleScale)
           .SetSize(m_size)
           .SetOutlineColor(m_outlineColor)
           .SetRingColor(m_ringColor)
           .SetCenterColor(m_centerColor);
    return builder;
}
