#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eoslink
{

// Console numbers as the command line expects them: "%g", so 10.0 → "10", 1.5 → "1.5".
std::string format_number(double value);

// ─── Cue identity ────────────────────────────────────────────────────────────

struct Cue
{
    int                   cuelist = 1;
    double                cue     = 0.0;
    int                   part    = 0;
    std::optional<int>    duration;
    std::optional<double> percentage;   // progress in [0, 1]

    // "1 / 10". The spaces around '/' are required by the console's parser.
    std::string cue_format() const;

    // Parses the console's cue text notification: "list/cue part [NN%]".
    // Throws DecodeError on any other shape.
    static Cue from_text(std::string_view text);

    bool operator==(const Cue&) const = default;
};

// ─── Cue properties ──────────────────────────────────────────────────────────
// Field order matches the console's reply; see record_codec.cpp for the schema.

struct CueProperties
{
    int    cuelist = 0;
    double cue     = 0.0;
    int    part    = 0;

    int         cueindex = 0;
    std::string uid;
    std::string label;

    double uptime     = 0.0;
    double updelay    = 0.0;
    double downtime   = 0.0;
    double downdelay  = 0.0;
    double focustime  = 0.0;
    double focusdelay = 0.0;
    double colortime  = 0.0;
    double colordelay = 0.0;
    double beamtime   = 0.0;
    double beamdelay  = 0.0;

    bool   preheat = false;
    double curve   = 0.0;
    int    rate    = 0;

    std::string markstr;
    std::string blockstr;
    std::string assertstr;
    std::string links;

    double      followtime   = 0.0;
    double      hangtime     = 0.0;
    bool        allfade      = false;
    int         numloops     = 0;
    bool        solo         = false;
    std::string timecode;
    int         partcount    = 0;
    std::string notes;
    std::string scene;
    bool        scene_end    = false;
    int         cuepartindex = 0;

    // Present only when the console reported data beyond (index, uid).
    std::optional<std::string> fx;
    std::optional<std::string> linked_cues;
    std::optional<std::string> actions;

    Cue identity() const { return Cue{cuelist, cue, part}; }

    bool is_blocked() const { return blockstr.find('B') != std::string::npos; }
    bool is_intensity_blocked() const { return blockstr.find('I') != std::string::npos; }
    bool is_asserted() const { return assertstr.find('A') != std::string::npos; }
};

// ─── Groups and macros ───────────────────────────────────────────────────────

struct GroupProperties
{
    double                   number = 0.0;
    std::string              uid;
    std::string              label;
    std::vector<std::string> channels;   // "1-5", "7", ...

    // "1 Thru 5 + 7"
    std::string channel_selection() const;
};

struct MacroProperties
{
    double                   number = 0.0;
    std::string              uid;
    std::string              label;
    std::string              mode;
    std::vector<std::string> command;
};

// ─── Console state ───────────────────────────────────────────────────────────

struct ConsoleState
{
    int                        user = 0;
    std::optional<Cue>         previous_cue;
    std::optional<Cue>         active_cue;
    std::optional<Cue>         pending_cue;
    std::string                show_name;
    int                        state  = 0;
    bool                       locked = false;
    std::map<int, std::string> softkeys;
    std::string                command_line;
};

// ─── Targets and tabs ────────────────────────────────────────────────────────

// Target names accepted by the console's "get/<target>/count" query.
inline constexpr std::array<std::string_view, 16> COUNTABLE_TARGETS = {
    "patch", "cuelist", "cue",   "group", "macro", "sub",  "preset", "ip",
    "fp",    "cp",      "bp",    "curve", "fx",    "snap", "pixmap", "ms",
};

bool is_countable_target(std::string_view target);

// Tab numbers typed on the console's tab keypad.
enum class Tab : int
{
    ChannelsTable       = 1,
    Psd                 = 2,
    MagicSheet          = 3,
    DirectSelects       = 4,
    MlControls          = 5,
    EffectStatus        = 6,
    VirtualKeyboard     = 7,
    EffectChannels      = 8,
    PixelMaps           = 9,
    PixelMapPreview     = 10,
    ShowControl         = 11,
    Patch               = 12,
    Effects             = 13,
    MagicSheetList      = 14,
    Submasters          = 15,
    Cues                = 16,
    Groups              = 17,
    Macros              = 18,
    Snapshots           = 19,
    Park                = 20,
    Curves              = 21,
    IntensityPalettes   = 22,
    FocusPalettes       = 23,
    ColorPalettes       = 24,
    BeamPalettes        = 25,
    Presets             = 26,
    ColorPicker         = 27,
    Faders              = 28,
    About               = 29,
    CommandHistory      = 30,
    LampControls        = 31,
    ChannelsInUse       = 32,
    ColorPaths          = 33,
    FaderListDisplay    = 35,
    FaderConfig         = 36,
    SacnOutputViewer    = 37,
    Augment3d           = 38,
    CustomDirectSelects = 39,
    EncoderMaps         = 40,
    Diagnostics         = 99,
    Manual              = 100,
};

}   // namespace eoslink
