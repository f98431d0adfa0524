#pragma once
// iens/io/depth_record.h
//
// One retained atom/defect from a result file, reduced to its depth below the
// surface (depth = surface_z - z; positive is below the surface).

#include <string>

namespace iens {
namespace io {

struct DepthRecord {
  std::string source_file;
  double depth = 0.0;
  std::string species_type;  // element or type column; empty when absent

  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

}  // namespace io
}  // namespace iens
