#pragma once
// iens/template/template_store.h
//
// Parameterized simulator input documents.
//
// A template is opaque text except for three named slots, each bound to a
// LAMMPS `variable <name> equal <value>` statement:
//
//   seed        variable seed  equal 12345
//   x_position  variable x_pos equal 0.0
//   y_position  variable y_pos equal 0.0
//
// Two rewrite styles exist and exactly one is active per batch:
//
//   Simple        the value portion of the assignment is replaced.
//   LoopRandomXY  the x/y assignments are bounded draws evaluated by the
//                 simulator, e.g.
//                   variable x_pos equal random(-20,20,12345+${i})
//                 and only the two bounds and the leading integer of the
//                 seed expression are replaced; `+${i}` and everything else
//                 stays untouched. A `seed` assignment is rewritten when
//                 present and is only required when a draw carries no
//                 literal offset of its own.
//
// Substitution is a pure text transform. Every byte outside the replaced
// value spans (indentation, spacing, comments, line endings) is preserved.
// A required slot that cannot be found is an error, never a silent no-op.

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/ensemble/run_config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iens {
namespace tmpl {

enum class Slot : u8 {
  Seed = 0,
  XPosition = 1,
  YPosition = 2,
};

inline constexpr std::string_view ToString(Slot s) noexcept {
  switch (s) {
    case Slot::Seed: return "seed";
    case Slot::XPosition: return "x_position";
    case Slot::YPosition: return "y_position";
  }
  return "unknown";
}

struct Document {
  std::string path;  // provenance; empty for in-memory documents
  std::string text;
};

struct SubstitutionSpec {
  Style style = Style::Simple;

  std::string seed_var = "seed";
  std::string x_var = "x_pos";
  std::string y_var = "y_pos";

  // Decimal places for simple-style positions.
  i32 precision = 6;

  const std::string& VarName(Slot s) const {
    switch (s) {
      case Slot::Seed: return seed_var;
      case Slot::XPosition: return x_var;
      case Slot::YPosition: return y_var;
    }
    return seed_var;
  }
};

// A slot as currently written in a document.
struct SlotValue {
  std::string raw;                // value text exactly as in the document
  std::optional<double> number;   // set when raw is a plain number

  bool random_draw = false;       // raw is random(lo,hi,seedexpr)
  Range bounds;
  std::optional<u64> seed_offset; // leading integer literal of seedexpr
  std::string seed_tail;          // rest of seedexpr, e.g. "+${i}"
};

// Reads a document from disk. Missing file -> kNotFound naming the path.
bool LoadDocument(const std::string& path, Document* out, Error* err = nullptr);

// Resolves `input` against `template_dir` (unless absolute) and loads it.
// On kNotFound the message lists the template directory, the attempted path
// and candidate input files found in the directory.
bool LoadTemplate(const std::string& template_dir,
                  const std::string& input,
                  Document* out,
                  Error* err = nullptr);

bool SaveDocument(const std::string& path, const Document& doc, Error* err = nullptr);

// Rewrites all slots for one run using spec.style. `run.style` must match.
bool Substitute(const Document& doc,
                const SubstitutionSpec& spec,
                const ensemble::RunConfig& run,
                Document* out,
                Error* err = nullptr);

// Reads back the first assignment of `slot`. kSlotNotFound if absent.
bool ReadSlot(const Document& doc,
              const SubstitutionSpec& spec,
              Slot slot,
              SlotValue* out,
              Error* err = nullptr);

// Style used by the x_position slot; Style::Unknown when the slot is absent.
Style DetectStyle(const Document& doc, const SubstitutionSpec& spec);

// Number formatting shared with run_params.txt.
std::string FormatFixed(double v, i32 precision);
std::string FormatShortest(double v);

}  // namespace tmpl
}  // namespace iens
