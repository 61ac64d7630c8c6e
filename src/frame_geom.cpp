// Facility Layout - Dual Pitch Portal Frame Geometry
// by Frank Gennari
// 10/18/26

#include "layout.h"


frame_geom_t compute_frame_geom(structure_params_t const &sp) {

	if (!(sp.width > 0.0)) {
		std::ostringstream oss;
		oss << "structure width must be positive (width=" << sp.width << ")";
		throw config_error_t(oss.str());
	}
	if (!(sp.ridge_height > sp.eaves_height)) { // flat or inverted roof has no valid pitch
		std::ostringstream oss;
		oss << "ridge height must be above eaves height (eaves=" << sp.eaves_height << ", ridge=" << sp.ridge_height << ")";
		throw config_error_t(oss.str());
	}
	frame_geom_t fg;
	fg.half_span    = 0.5*sp.width;
	fg.rise         = sp.ridge_height - sp.eaves_height;
	fg.pitch        = atan(fg.rise/fg.half_span);
	fg.slope_len    = sqrt(fg.rise*fg.rise + fg.half_span*fg.half_span);
	fg.rafter_len   = fg.slope_len + sp.rafter_overhang;
	fg.eaves_height = sp.eaves_height;
	return fg;
}
