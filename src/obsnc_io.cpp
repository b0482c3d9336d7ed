/**
 * @file obsnc_io.cpp
 * @brief Implementation of NetCDF output.
 *
 * @see obsnc_io.hpp for class documentation
 */

#include "obsnc_io.hpp"
#include "obsnc_errors.hpp"
#include "obsnc_logger.hpp"
#include "metadata/attribute_annotator.hpp"
#include <filesystem>
#include <netcdf.h>
#include <system_error>
#include <type_traits>
#include <vector>

namespace fs = std::filesystem;

namespace obsnc {

namespace {

nc_type nc_type_of(const ColumnData &data) {
  return std::visit(
      [](const auto &values) -> nc_type {
        using T = typename std::decay_t<decltype(values)>::value_type;
        if constexpr (std::is_same_v<T, std::int32_t>) {
          return NC_INT;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return NC_INT64;
        } else {
          return NC_DOUBLE;
        }
      },
      data);
}

void put_attribute(const NcFile &file, int varid, const std::string &name,
                   const AttrValue &value) {
  const char *cname = name.c_str();
  int status = std::visit(
      [&](const auto &v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return nc_put_att_text(file.id(), varid, cname, v.size(), v.c_str());
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
          return nc_put_att_int(file.id(), varid, cname, NC_INT, 1, &v);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          long long ll = v;
          return nc_put_att_longlong(file.id(), varid, cname, NC_INT64, 1, &ll);
        } else {
          return nc_put_att_double(file.id(), varid, cname, NC_DOUBLE, 1, &v);
        }
      },
      value);
  file.check(status, "cannot write attribute '" + name + "'");
}

// The fill value must have exactly the variable's type
void define_fill(const NcFile &file, int varid, nc_type type,
                 const AttrValue &value) {
  if (std::holds_alternative<std::string>(value)) {
    throw PersistenceError(file.path(), "_FillValue must be numeric");
  }
  const double as_double = std::visit(
      [](const auto &x) -> double {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return 0.0;
        } else {
          return static_cast<double>(x);
        }
      },
      value);

  int status = NC_NOERR;
  if (type == NC_INT) {
    int fill = static_cast<int>(as_double);
    if (const auto *i = std::get_if<std::int32_t>(&value)) {
      fill = *i;
    }
    status = nc_def_var_fill(file.id(), varid, NC_FILL, &fill);
  } else if (type == NC_INT64) {
    long long fill = static_cast<long long>(as_double);
    if (const auto *i = std::get_if<std::int64_t>(&value)) {
      fill = *i;
    }
    status = nc_def_var_fill(file.id(), varid, NC_FILL, &fill);
  } else {
    double fill = as_double;
    status = nc_def_var_fill(file.id(), varid, NC_FILL, &fill);
  }
  file.check(status, "cannot define fill value");
}

int define_variable(const NcFile &file, const Variable &var, int dimid) {
  int varid = -1;
  const nc_type type = nc_type_of(var.data);
  file.check(nc_def_var(file.id(), var.name.c_str(), type, 1, &dimid, &varid),
             "cannot define variable '" + var.name + "'");

  for (const auto &[name, value] : var.attrs) {
    if (name == "_FillValue") {
      define_fill(file, varid, type, value);
    } else {
      put_attribute(file, varid, name, value);
    }
  }
  return varid;
}

void put_values(const NcFile &file, int varid, const Variable &var) {
  if (var.size() == 0) {
    return;
  }
  int status = std::visit(
      [&](const auto &values) -> int {
        using T = typename std::decay_t<decltype(values)>::value_type;
        if constexpr (std::is_same_v<T, std::int32_t>) {
          return nc_put_var_int(file.id(), varid, values.data());
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          std::vector<long long> buffer(values.begin(), values.end());
          return nc_put_var_longlong(file.id(), varid, buffer.data());
        } else {
          return nc_put_var_double(file.id(), varid, values.data());
        }
      },
      var.data);
  file.check(status, "cannot write values of '" + var.name + "'");
}

} // namespace

// ============================================================================
// NcFile implementation
// ============================================================================

NcFile::~NcFile() {
  if (m_ncid >= 0) {
    // Error path: discard whatever was defined or written
    nc_abort(m_ncid);
    m_ncid = -1;
  }
}

void NcFile::create(const std::string &path) {
  int ncid = -1;
  m_path = path;
  check(nc_create(path.c_str(), NC_NETCDF4 | NC_CLOBBER, &ncid),
        "cannot create file");
  m_ncid = ncid;
}

void NcFile::open(const std::string &path) {
  int ncid = -1;
  m_path = path;
  check(nc_open(path.c_str(), NC_NOWRITE, &ncid), "cannot open file");
  m_ncid = ncid;
}

void NcFile::close() {
  if (m_ncid < 0) {
    return;
  }
  int status = nc_close(m_ncid);
  m_ncid = -1;
  check(status, "cannot close file");
}

void NcFile::check(int status, const std::string &what) const {
  if (status != NC_NOERR) {
    throw PersistenceError(m_path, what + ": " + nc_strerror(status));
  }
}

// ============================================================================
// NetcdfWriter implementation
// ============================================================================

std::string NetcdfWriter::output_filename(const std::string &input_path) {
  return AttributeAnnotator::title_from_path(input_path) + ".nc";
}

std::string NetcdfWriter::write(const Dataset &ds,
                                const std::string &output_dir,
                                const std::string &filename) const {
  const fs::path final_path = fs::path(output_dir) / filename;
  const fs::path part_path = fs::path(final_path.string() + PARTIAL_SUFFIX);

  std::error_code ec;
  if (!output_dir.empty()) {
    fs::create_directories(output_dir, ec);
    if (ec) {
      throw PersistenceError(output_dir, "cannot create output directory: " +
                                             ec.message());
    }
  }

  try {
    write_file(ds, part_path.string());
  } catch (...) {
    fs::remove(part_path, ec);
    throw;
  }

  fs::rename(part_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(part_path, ignored);
    throw PersistenceError(final_path.string(),
                           "cannot move finished file into place: " +
                               ec.message());
  }

  OBSNC_LOG_DEBUG("Wrote {} time steps to '{}'", ds.size(),
                  final_path.string());
  return final_path.string();
}

void NetcdfWriter::write_file(const Dataset &ds,
                              const std::string &path) const {
  NcFile file;
  file.create(path);

  int dimid = -1;
  file.check(nc_def_dim(file.id(), Dataset::TIME_NAME, ds.size(), &dimid),
             "cannot define dimension 'time'");

  const int time_varid = define_variable(file, ds.time(), dimid);
  std::vector<int> varids;
  varids.reserve(ds.data_vars().size());
  for (const auto &var : ds.data_vars()) {
    varids.push_back(define_variable(file, var, dimid));
  }

  for (const auto &[name, value] : ds.attrs()) {
    put_attribute(file, NC_GLOBAL, name, value);
  }

  file.check(nc_enddef(file.id()), "cannot leave define mode");

  put_values(file, time_varid, ds.time());
  for (std::size_t i = 0; i < varids.size(); ++i) {
    put_values(file, varids[i], ds.data_vars()[i]);
  }

  file.close();
}

} // namespace obsnc
