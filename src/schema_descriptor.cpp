#include "ocl_gaiasync/schema_descriptor.h"
#include "ocl_gaiasync/types.h"
#include <cctype>
#include <unordered_set>

namespace ocl {
namespace gaiasync {

SchemaDescriptor::SchemaDescriptor(std::string store_table,
                                   std::string remote_table,
                                   std::vector<ColumnSpec> columns,
                                   std::string id_column)
    : store_table_(std::move(store_table)),
      remote_table_(std::move(remote_table)),
      columns_(std::move(columns)),
      id_column_(std::move(id_column)),
      id_index_(0) {

    if (!isSafeIdentifier(store_table_) || !isSafeIdentifier(remote_table_)) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Unsafe table name in schema descriptor");
    }

    std::unordered_set<std::string> seen;
    bool found_id = false;
    for (size_t i = 0; i < columns_.size(); ++i) {
        const auto& column = columns_[i];
        if (!isSafeIdentifier(column.name) || column.name.find('.') != std::string::npos) {
            throw SyncException(ErrorCode::INVALID_PARAMS, "Unsafe column name: " + column.name);
        }
        if (!seen.insert(column.name).second) {
            throw SyncException(ErrorCode::INVALID_PARAMS, "Duplicate column: " + column.name);
        }
        if (column.name == id_column_) {
            if (column.type != ColumnType::INTEGER) {
                throw SyncException(ErrorCode::INVALID_PARAMS,
                                    "Identifier column must be INTEGER: " + column.name);
            }
            id_index_ = i;
            found_id = true;
        }
    }

    if (!found_id) {
        throw SyncException(ErrorCode::INVALID_PARAMS,
                            "Schema has no identifier column '" + id_column_ + "'");
    }
}

std::vector<std::string> SchemaDescriptor::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

std::optional<size_t> SchemaDescriptor::indexOf(const std::string& column) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == column) {
            return i;
        }
    }
    return std::nullopt;
}

bool SchemaDescriptor::isSafeIdentifier(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Gaia DR2 gaia_source
// https://gea.esac.esa.int/archive/documentation/GDR2/Gaia_archive/chap_datamodel/sec_dm_main_tables/ssec_dm_gaia_source.html
// =============================================================================

const SchemaDescriptor& SchemaDescriptor::gaiaDR2() {
    static const SchemaDescriptor schema(
        "gaiadr2_source",
        "gaiadr2.gaia_source",
        {
            {"solution_id", ColumnType::INTEGER, true},
            {"designation", ColumnType::TEXT, true},
            {"source_id", ColumnType::INTEGER, true},
            {"random_index", ColumnType::INTEGER},
            {"ref_epoch", ColumnType::REAL},
            {"ra", ColumnType::REAL},
            {"ra_error", ColumnType::REAL},
            {"dec", ColumnType::REAL},
            {"dec_error", ColumnType::REAL},
            {"parallax", ColumnType::REAL},
            {"parallax_error", ColumnType::REAL},
            {"parallax_over_error", ColumnType::REAL},
            {"pmra", ColumnType::REAL},
            {"pmra_error", ColumnType::REAL},
            {"pmdec", ColumnType::REAL},
            {"pmdec_error", ColumnType::REAL},
            {"ra_dec_corr", ColumnType::REAL},
            {"ra_parallax_corr", ColumnType::REAL},
            {"ra_pmra_corr", ColumnType::REAL},
            {"ra_pmdec_corr", ColumnType::REAL},
            {"dec_parallax_corr", ColumnType::REAL},
            {"dec_pmra_corr", ColumnType::REAL},
            {"dec_pmdec_corr", ColumnType::REAL},
            {"parallax_pmra_corr", ColumnType::REAL},
            {"parallax_pmdec_corr", ColumnType::REAL},
            {"pmra_pmdec_corr", ColumnType::REAL},
            {"astrometric_n_obs_al", ColumnType::INTEGER},
            {"astrometric_n_obs_ac", ColumnType::INTEGER},
            {"astrometric_n_good_obs_al", ColumnType::INTEGER},
            {"astrometric_n_bad_obs_al", ColumnType::INTEGER},
            {"astrometric_gof_al", ColumnType::REAL},
            {"astrometric_chi2_al", ColumnType::REAL},
            {"astrometric_excess_noise", ColumnType::REAL},
            {"astrometric_excess_noise_sig", ColumnType::REAL},
            {"astrometric_params_solved", ColumnType::INTEGER},
            {"astrometric_primary_flag", ColumnType::BOOLEAN},
            {"astrometric_weight_al", ColumnType::REAL},
            {"astrometric_pseudo_colour", ColumnType::REAL},
            {"astrometric_pseudo_colour_error", ColumnType::REAL},
            {"mean_varpi_factor_al", ColumnType::REAL},
            {"astrometric_matched_observations", ColumnType::INTEGER},
            {"visibility_periods_used", ColumnType::INTEGER},
            {"astrometric_sigma5d_max", ColumnType::REAL},
            {"frame_rotator_object_type", ColumnType::INTEGER},
            {"matched_observations", ColumnType::INTEGER},
            {"duplicated_source", ColumnType::BOOLEAN},
            {"phot_g_n_obs", ColumnType::INTEGER},
            {"phot_g_mean_flux", ColumnType::REAL},
            {"phot_g_mean_flux_error", ColumnType::REAL},
            {"phot_g_mean_flux_over_error", ColumnType::REAL},
            {"phot_g_mean_mag", ColumnType::REAL},
            {"phot_bp_n_obs", ColumnType::INTEGER},
            {"phot_bp_mean_flux", ColumnType::REAL},
            {"phot_bp_mean_flux_error", ColumnType::REAL},
            {"phot_bp_mean_flux_over_error", ColumnType::REAL},
            {"phot_bp_mean_mag", ColumnType::REAL},
            {"phot_rp_n_obs", ColumnType::INTEGER},
            {"phot_rp_mean_flux", ColumnType::REAL},
            {"phot_rp_mean_flux_error", ColumnType::REAL},
            {"phot_rp_mean_flux_over_error", ColumnType::REAL},
            {"phot_rp_mean_mag", ColumnType::REAL},
            {"phot_bp_rp_excess_factor", ColumnType::REAL},
            {"phot_proc_mode", ColumnType::INTEGER},
            {"bp_rp", ColumnType::REAL},
            {"bp_g", ColumnType::REAL},
            {"g_rp", ColumnType::REAL},
            {"radial_velocity", ColumnType::REAL},
            {"radial_velocity_error", ColumnType::REAL},
            {"rv_nb_transits", ColumnType::INTEGER},
            {"rv_template_teff", ColumnType::REAL},
            {"rv_template_logg", ColumnType::REAL},
            {"rv_template_fe_h", ColumnType::REAL},
            {"phot_variable_flag", ColumnType::TEXT},
            {"l", ColumnType::REAL},
            {"b", ColumnType::REAL},
            {"ecl_lon", ColumnType::REAL},
            {"ecl_lat", ColumnType::REAL},
            {"priam_flags", ColumnType::INTEGER},
            {"teff_val", ColumnType::REAL},
            {"teff_percentile_lower", ColumnType::REAL},
            {"teff_percentile_upper", ColumnType::REAL},
            {"a_g_val", ColumnType::REAL},
            {"a_g_percentile_lower", ColumnType::REAL},
            {"a_g_percentile_upper", ColumnType::REAL},
            {"e_bp_min_rp_val", ColumnType::REAL},
            {"e_bp_min_rp_percentile_lower", ColumnType::REAL},
            {"e_bp_min_rp_percentile_upper", ColumnType::REAL},
            {"flame_flags", ColumnType::INTEGER},
            {"radius_val", ColumnType::REAL},
            {"radius_percentile_lower", ColumnType::REAL},
            {"radius_percentile_upper", ColumnType::REAL},
            {"lum_val", ColumnType::REAL},
            {"lum_percentile_lower", ColumnType::REAL},
            {"lum_percentile_upper", ColumnType::REAL}
        });
    return schema;
}

} // namespace gaiasync
} // namespace ocl
