#pragma once

#include <eoslink/fwd.hpp>
#include <eoslink/records.hpp>

#include <string>
#include <vector>

namespace eoslink
{

// Idempotent programming workflows on top of a Console.
//
// Each operation first queries the console and only sends the command lines
// needed to reach the desired result. A query that times out or comes back
// incomplete is taken to mean the target does not exist; other failures
// propagate unchanged. Nothing is retried.
class Programmer
{
   public:
    explicit Programmer(Console& console) : console_(console) {}

    // Records an empty cue in blind if it does not exist yet.
    void record_blank_cue(const Cue& cue);

    void intensity_block_cue(const Cue& cue);
    void block_cue(const Cue& cue);
    void assert_cue(const Cue& cue);

    // Not queried first: setting the same time twice is harmless.
    void set_time(const Cue& cue, double seconds);

    // Warns before replacing a different scene name.
    void add_scene(const Cue& cue, const std::string& scene);

    // Creates the group, or with `overwrite` updates label and channels of an
    // existing one. Throws ConsoleError if it exists, differs, and
    // `overwrite` is false.
    void record_group(const GroupProperties& group, bool overwrite = false);

    // Records a new macro by typing `keys` into the macro editor. Throws
    // ConsoleError if the macro already exists.
    void record_macro(double number, const std::vector<std::string>& keys);

    // True if the cue answers a full property query.
    bool cue_exists(const Cue& cue);

   private:
    Console& console_;
};

}   // namespace eoslink
