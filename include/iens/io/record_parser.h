#pragma once
// iens/io/record_parser.h
//
// Result-file readers producing DepthRecords.
//
// Two layouts are understood, chosen by content (never by extension):
//
//   Defect list  OVITO-style table with a `#` header naming Position.X/Y/Z,
//                an XYZ file (atom count line, comment line, `El x y z`
//                rows), or bare rows (`x y z` or `El x y z`).
//   Trajectory   LAMMPS text dump. Only the final `ITEM: ATOMS` frame counts;
//                x|xu|xs|xsu columns (and their y/z twins) are accepted and
//                scaled coordinates are mapped through that frame's box.
//
// Rows that do not fit the layout are skipped and counted, never fatal.
// Schema problems (no coordinate columns, type filter without a type column)
// are kFormat errors.

#include "iens/core/error.h"
#include "iens/core/types.h"
#include "iens/io/depth_record.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace iens {
namespace io {

struct ParseOptions {
  // depth = surface_z - z. Required; absence is kInvalidSpec.
  std::optional<double> surface_z;

  // Keep only rows whose type/element column equals this tag. Numeric tags
  // compare by integer value, so "3" matches "3.0".
  std::optional<std::string> type_filter;

  // Drop records above the surface (depth < 0) at parse time.
  bool skip_negative = false;
};

struct ParseStats {
  std::string format;  // "defect_list" | "trajectory" | "empty"
  u64 rows_seen = 0;
  u64 skipped_lines = 0;
  u64 filtered_by_type = 0;
  u64 dropped_negative = 0;
  u64 records = 0;
  u64 frames = 0;  // trajectory only
};

enum class RecordFormat : u8 {
  Empty = 0,
  DefectList = 1,
  Trajectory = 2,
};

std::string_view ToString(RecordFormat f) noexcept;

// First non-blank line starting with "ITEM:" -> Trajectory; any other
// content -> DefectList; nothing -> Empty.
RecordFormat SniffFormat(std::string_view text);

class DefectListParser {
 public:
  static constexpr std::string_view kName = "defect_list";

  bool Parse(std::string_view text,
             const std::string& source,
             const ParseOptions& opts,
             std::vector<DepthRecord>* out,
             ParseStats* stats,
             Error* err) const;
};

class TrajectoryParser {
 public:
  static constexpr std::string_view kName = "trajectory";

  bool Parse(std::string_view text,
             const std::string& source,
             const ParseOptions& opts,
             std::vector<DepthRecord>* out,
             ParseStats* stats,
             Error* err) const;
};

using RecordParser = std::variant<DefectListParser, TrajectoryParser>;

RecordParser MakeParser(RecordFormat format);

// Parses in-memory text; `source` labels the records. Records are appended.
bool ParseText(std::string_view text,
               const std::string& source,
               const ParseOptions& opts,
               std::vector<DepthRecord>* out,
               ParseStats* stats = nullptr,
               Error* err = nullptr);

// Reads `path` and appends its records to *out. kNotFound when missing.
bool ParseRecords(const std::string& path,
                  const ParseOptions& opts,
                  std::vector<DepthRecord>* out,
                  ParseStats* stats = nullptr,
                  Error* err = nullptr);

}  // namespace io
}  // namespace iens
