/**
 * @file attribute_annotator.cpp
 * @brief Implementation of AttributeAnnotator.
 */

#include "attribute_annotator.hpp"
#include "../obsnc_errors.hpp"
#include "../obsnc_logger.hpp"
#include <filesystem>

namespace obsnc {

const FieldSpec &AttributeAnnotator::lookup(const Dataset &ds,
                                            const std::string &name) const {
  const FieldSpec *field = m_schema.find(name);
  if (!field || field->units.empty()) {
    throw LookupError(ds.source_path(),
                      "no unit entry for variable '" + name + "'");
  }
  return *field;
}

void AttributeAnnotator::annotate(Dataset &ds) const {
  const bool cf = m_schema.profile() == MetadataProfile::CF;

  auto &time = ds.time();
  time.attrs.set("units", lookup(ds, time.name).units);

  for (auto &var : ds.data_vars()) {
    const auto &field = lookup(ds, var.name);
    var.attrs.set("units", field.units);

    if (cf) {
      if (field.standard_name.empty()) {
        throw LookupError(ds.source_path(),
                          "no standard name entry for variable '" + var.name +
                              "'");
      }
      var.attrs.set("standard_name", field.standard_name);
      var.attrs.set("long_name", var.name);
    }
  }

  if (!cf) {
    ds.attrs().set("featureType", FEATURE_TYPE_TIME_SERIES);
  }
  ds.attrs().set("title", title_from_path(ds.source_path()));

  verify_units(ds);

  OBSNC_LOG_DEBUG("Annotated {} variables of '{}' ({} profile)",
                  ds.data_vars().size() + 1, ds.source_path(),
                  metadata_profile_to_str(m_schema.profile()));
}

void AttributeAnnotator::verify_units(const Dataset &ds) {
  if (ds.time().attrs.get_string("units").empty()) {
    throw LookupError(ds.source_path(),
                      "variable '" + ds.time().name + "' has no units");
  }
  for (const auto &var : ds.data_vars()) {
    if (var.attrs.get_string("units").empty()) {
      throw LookupError(ds.source_path(),
                        "variable '" + var.name + "' has no units");
    }
  }
}

std::string AttributeAnnotator::title_from_path(const std::string &path) {
  return std::filesystem::path(path).stem().string();
}

} // namespace obsnc
