#include <gtest/gtest.h>
#include <wx/init.h>
#include <wx/log.h>
#include <cstdio>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // wxColour, wxFileConfig, wxLog and image-backed graphics contexts need the
    // library initialized, no display required
    wxInitializer initializer;
    if (!initializer.IsOk()) {
        fprintf(stderr, "Failed to initialize wxWidgets\n");
        return 1;
    }

    // Keep warnings visible, hide informational chatter
    wxLog::SetLogLevel(wxLOG_Warning);

    return RUN_ALL_TESTS();
}
