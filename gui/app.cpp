// gui/app.cpp
// Minimal SDL2 + Dear ImGui debug view for the wordcpu core (SDL_Renderer2 backend)
#include <filesystem>
#include <cstdio>
#include <memory>
#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"  // SDL2 renderer v2 backend

#include "cpu.hpp"
#include "devices.hpp"
#include "disasm.hpp"
#include "loader.hpp"

// Forward declaration — implemented in src/demo_program.cpp
extern std::vector<uint8_t> demo_program();

static constexpr uint64_t OUT0_ADDR = 0x20000;

// Helper: give windows an initial position/size (first run only).
static inline void PlaceFirstUse(const ImVec2& pos, const ImVec2& size) {
    ImGui::SetNextWindowPos(pos, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(size, ImGuiCond_FirstUseEver);
}

static void wordHexView(const uint64_t* mem, size_t size, uint32_t start, int rows = 16, int cols = 4) {
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(6, 2));
    for (int r = 0; r < rows; ++r) {
        uint32_t base = start + static_cast<uint32_t>(r) * cols;
        if (base >= size) break;
        ImGui::Text("%04X:", (unsigned)base);
        ImGui::SameLine();
        for (int c = 0; c < cols; ++c) {
            uint32_t addr = base + (uint32_t)c;
            if (addr >= size) break;
            ImGui::Text("%016llX", (unsigned long long)mem[addr]);
            if (c != cols - 1) ImGui::SameLine();
        }
    }
    ImGui::PopStyleVar();
}

static void byteHexView(const uint8_t* mem, size_t size, uint32_t start, int rows = 8, int cols = 16) {
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(6, 2));
    for (int r = 0; r < rows; ++r) {
        uint32_t base = start + static_cast<uint32_t>(r) * cols;
        if (base >= size) break;
        ImGui::Text("%04X:", (unsigned)base);
        ImGui::SameLine();
        for (int c = 0; c < cols; ++c) {
            uint32_t addr = base + (uint32_t)c;
            if (addr >= size) break;
            ImGui::Text("%02X", mem[addr]);
            if (c != cols - 1) ImGui::SameLine();
        }
    }
    ImGui::PopStyleVar();
}

int main(int, char**) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_GAMECONTROLLER) != 0) {
        std::fprintf(stderr, "SDL Error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "wordcpu debug view",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1800, 1100,
        SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) { std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError()); SDL_Quit(); return 1; }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) { std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError()); SDL_DestroyWindow(window); SDL_Quit(); return 1; }

    // --- ImGui init ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.FontGlobalScale = 2.0f;

    {
        const char* kFont = "Roboto-Medium.ttf";
        if (std::filesystem::exists(kFont)) {
            io.Fonts->AddFontFromFileTTF(kFont, 24.0f);
        } else {
            ImFontConfig cfg; cfg.SizePixels = 22.0f;
            io.Fonts->AddFontDefault(&cfg);
        }
    }

    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(1.2f);

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForSDLRenderer failed\n");
        SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDLRenderer2_Init failed\n");
        ImGui_ImplSDL2_Shutdown(); SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }

    // --- Machine init ---
    auto out0 = std::make_unique<OutputPort>("out0", OUT0_ADDR);
    OutputPort* port = out0.get();
    std::vector<DevicePtr> devices;
    devices.push_back(std::move(out0));
    auto cpu = std::make_unique<Machine>(make_image(demo_program()), std::move(devices));

    bool running = true;
    bool autoRun = false;
    bool stopped = false;          // last tick faulted
    std::string lastFault = "(none)";
    int  instrPerFrame = 1;
    uint32_t memBase = 0x0000;

    auto stepOne = [&](Machine& c) {
        if (stopped) return;
        try {
            c.tick();
        } catch (const CpuError& e) {
            stopped = true;
            autoRun = false;
            lastFault = std::string(fault_name(e.fault())) + ": " + e.what();
        }
    };

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) running = false;
            if (event.type == SDL_WINDOWEVENT &&
                event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window)) running = false;
        }

        if (autoRun) for (int i = 0; i < instrPerFrame && !stopped; ++i) stepOne(*cpu);

        ImGui_ImplSDL2_NewFrame();
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui::NewFrame();

        // ---- Controls ----
        PlaceFirstUse({20,20},   {1000,200});
        ImGui::Begin("Controls");
        ImGui::Text("X:%04llX  ticks:%llu", (unsigned long long)cpu->reg.X, (unsigned long long)cpu->ticks);
        ImGui::Text("last fault: %s", lastFault.c_str());
        if (ImGui::Button("Step")) { stepOne(*cpu); } ImGui::SameLine();
        ImGui::Checkbox("Run", &autoRun); ImGui::SameLine();
        ImGui::SetNextItemWidth(140); ImGui::InputInt("instr/frame", &instrPerFrame);
        if (instrPerFrame < 1) instrPerFrame = 1;
        ImGui::SameLine();
        if (ImGui::Button("Reset")) { cpu->reset(); port->clear(); stopped = false; lastFault = "(none)"; }
        ImGui::End();

        // ---- Registers ----
        PlaceFirstUse({20,240},  {1000,220});
        ImGui::Begin("Registers");
        ImGui::Text("A: %016llX", (unsigned long long)cpu->reg.A);
        ImGui::Text("B: %016llX", (unsigned long long)cpu->reg.B);
        ImGui::Text("S: %016llX", (unsigned long long)cpu->reg.S);
        ImGui::Text("X: %016llX", (unsigned long long)cpu->reg.X);
        ImGui::Separator();
        ImGui::TextUnformatted(disasm_one(cpu->program, cpu->reg.X).c_str());
        ImGui::End();

        // ---- Memory ----
        PlaceFirstUse({1040,20}, {720,720});
        ImGui::Begin("Memory");
        static char baseBuf[8] = "0000";
        ImGui::SetNextItemWidth(180);
        if (ImGui::InputText("Base (hex)", baseBuf, IM_ARRAYSIZE(baseBuf),
            ImGuiInputTextFlags_CharsHexadecimal | ImGuiInputTextFlags_CharsNoBlank)) {
            unsigned v = 0; if (std::sscanf(baseBuf, "%x", &v) == 1) memBase = v & 0xFFFF;
        }
        ImGui::BeginChild("hex", ImVec2(0, 420), true);
        wordHexView(cpu->mem.data(), cpu->mem.size(), memBase, 16, 4);
        ImGui::EndChild();
        ImGui::Separator(); ImGui::Text("Program (0x10000..) around X");
        ImGui::BeginChild("prog", ImVec2(0, 180), true);
        uint32_t progBase = static_cast<uint32_t>(std::min<uint64_t>(cpu->reg.X, cpu->program.size() - 1) & ~0xFull);
        byteHexView(cpu->program.data(), cpu->program.size(), progBase, 4, 16);
        ImGui::EndChild();
        ImGui::End();

        PlaceFirstUse({1040,760}, {720,280});
        ImGui::Begin("Timeline");
        static int maxRows = 256; ImGui::SliderInt("Rows", &maxRows, 64, 2000);
        int total = static_cast<int>(cpu->timeline.size());
        int start = std::max(0, total - maxRows);
        // selection is by tick number so it survives the timeline dropping old frames
        static uint64_t selectedTick = 0;
        static bool haveSelection = false;
        ImGui::BeginChild("tl", ImVec2(0, 220), true);
        for (int i = start; i < total; ++i) {
            const auto& t = cpu->timeline[i];
            char label[160];
            std::snprintf(label, sizeof(label), "#%llu X=%04llX %-10s A=%llX B=%llX S=%llX ev=%zu",
                (unsigned long long)t.tick, (unsigned long long)t.pc,
                mnemonic(static_cast<Op>(t.opcode)),
                (unsigned long long)t.a, (unsigned long long)t.b, (unsigned long long)t.s,
                t.events.size());
            bool selected = haveSelection && t.tick == selectedTick;
            ImGui::PushID(i);
            if (ImGui::Selectable(label, selected)) {
                haveSelection = !selected;
                selectedTick = t.tick;
            }
            ImGui::PopID();
            if (selected)
                for (const auto& e : t.events)
                    ImGui::BulletText("%s [%05llX] = %llX  %s",
                        (e.dir == BusDir::Read ? "RD" : "WR"), (unsigned long long)e.address,
                        (unsigned long long)e.data, e.note.c_str());
        }
        ImGui::EndChild();
        ImGui::End();

        // ---- out0 log ----
        PlaceFirstUse({20,480},  {1000,320});
        ImGui::Begin("out0 Log (writes to 0x20000)");
        ImGui::BeginChild("out", ImVec2(0, 220), true);
        const auto& log = port->log();
        for (size_t i = 0; i < log.size(); ++i) {
            ImGui::Text("%llu", (unsigned long long)log[i]);
            if (i + 1 < log.size()) ImGui::SameLine();
        }
        ImGui::EndChild();
        if (ImGui::Button("Clear")) port->clear();
        ImGui::End();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 25, 25, 25, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
