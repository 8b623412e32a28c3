#pragma once

#include <filesystem>
#include <string>

// Dear ImGui (core only; backends are included in the .cpp)
#include <imgui.h>

// Forward declarations to avoid leaking SDL headers from the public interface
struct SDL_Window;
struct SDL_Renderer;
union SDL_Event;

namespace ghostledger::ui
{
    class ImGuiLayer
    {
    public:
        // imgui.ini is kept in `iniDir` (empty = no ini file).
        bool initialize(SDL_Window* window, SDL_Renderer* renderer,
                        const std::filesystem::path& iniDir, float fontScale);
        void shutdown();

        // Route SDL events to the ImGui backend; return true if ImGui wants it.
        bool processEvent(const SDL_Event& event);

        // Call once per frame (before you draw any ImGui widgets)
        void newFrame();

        // Call once per frame (after you've built your UI). Clears and presents.
        void render();

        bool wantsKeyboard() const { return ImGui::GetIO().WantCaptureKeyboard; }

    private:
        SDL_Window* m_window = nullptr;
        SDL_Renderer* m_renderer = nullptr;
        std::string m_iniUtf8;
        bool m_initialized = false;
    };
}
