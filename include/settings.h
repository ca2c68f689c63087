#ifndef SETTINGS_H
#define SETTINGS_H

#include <wx/wx.h>
#include <wx/fileconf.h>
#include <memory>
#include "circularprogressdrawable.h"

/**
 * @brief Settings manager for the circular progress demo
 *
 * Stores configuration in user space (AppData on Windows, ~/.circularprogress
 * on Linux) using INI format. Colours are kept as HTML "#RRGGBB" strings.
 */
class Settings
{
public:
    Settings();
    explicit Settings(const wxString& configPath);
    ~Settings();

    // Load settings from config file
    void Load();

    // Save settings to config file
    void Save();

    // Drawable
    int GetRingWidth() const { return m_ringWidth; }
    void SetRingWidth(int width) { m_ringWidth = width; }

    float GetInnerCircleScale() const { return m_innerCircleScale; }
    void SetInnerCircleScale(float scale) { m_innerCircleScale = scale; }

    int GetSize() const { return m_size; }
    void SetSize(int size) { m_size = size; }

    wxColour GetOutlineColor() const { return m_outlineColor; }
    void SetOutlineColor(const wxColour& colour) { m_outlineColor = colour; }

    wxColour GetRingColor() const { return m_ringColor; }
    void SetRingColor(const wxColour& colour) { m_ringColor = colour; }

    wxColour GetCenterColor() const { return m_centerColor; }
    void SetCenterColor(const wxColour& colour) { m_centerColor = colour; }

    // Demo animation
    int GetTickInterval() const { return m_tickInterval; }
    void SetTickInterval(int ms) { m_tickInterval = ms; }

    int GetLevelStep() const { return m_levelStep; }
    void SetLevelStep(int step) { m_levelStep = step; }

    float GetSpinStep() const { return m_spinStep; }
    void SetSpinStep(float degrees) { m_spinStep = degrees; }

    // Builder seeded with the drawable settings
    CircularProgressDrawable::Builder CreateBuilder() const;

    // Get config file path
    wxString GetConfigFilePath() const { return m_configPath; }

private:
    void Open();
    wxColour ReadColour(const wxString& key, const wxString& fallback) const;

    // Config file
    wxString m_configPath;
    std::unique_ptr<wxFileConfig> m_config;

    // progress/
    int m_ringWidth;            // Progress arc stroke width (default: 10)
    float m_innerCircleScale;   // Inner circle radius / outer radius (default: 0.75)
    int m_size;                 // Fixed size in pixels, 0 fills the panel (default: 0)
    wxColour m_outlineColor;    // Default #A0A0A0
    wxColour m_ringColor;       // Default #0096FF
    wxColour m_centerColor;     // Default #FFFFFF

    // demo/
    int m_tickInterval;         // Timer period (default: 16ms)
    int m_levelStep;            // Level added per tick (default: 50 of 10000)
    float m_spinStep;           // Indeterminate rotation per tick (default: 6 degrees)
};

#endif // SETTINGS_H
