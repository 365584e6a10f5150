#include "gui_sdl/SettingsPanel.hpp"
#include "gui_sdl/Application.hpp"

#include <imgui.h>

namespace blockblast::gui_sdl {

void renderSettingsPanel(Application& app, bool* open)
{
    if (!open || !*open) return;

    int w = 0, h = 0;
    app.getWindowSize(w, h);

    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(320, 200), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    if (!ImGui::Begin("Settings", open, flags)) {
        ImGui::End();
        return;
    }

    auto settings = app.session().settings();
    bool changed = false;
    changed |= ImGui::Checkbox("Sound effects", &settings.soundEnabled);
    changed |= ImGui::Checkbox("Music", &settings.musicEnabled);
    changed |= ImGui::Checkbox("Haptics", &settings.hapticsEnabled);

    if (changed) {
        app.session().updateSettings(settings);
    }

    ImGui::Separator();
    if (ImGui::Button("Close", ImVec2(-1, 0))) {
        *open = false;
    }

    ImGui::End();
}

} // namespace blockblast::gui_sdl
