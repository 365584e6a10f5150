#pragma once

namespace blockblast::gui_sdl {

class Application;

// Modal-like window with the sound / music / haptics toggles.
// Changes are written through the session right away.
void renderSettingsPanel(Application& app, bool* open);

} // namespace blockblast::gui_sdl
