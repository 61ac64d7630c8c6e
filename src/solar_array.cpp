// Facility Layout - Rooftop Solar Array Placement
// by Frank Gennari
// 10/18/26

#include "layout.h"


unsigned get_num_panels(solar_params_t const &sp) {return 2*sp.rows_per_slope*sp.panels_per_row;} // both slopes

// raw offsets within the slope plane, before mirroring and rotation; x runs up the slope, z along the building
void get_panel_offsets(solar_params_t const &sp, unsigned row, unsigned col, float &x_off, float &z_off) {
	x_off = row*(sp.panel_length + sp.gap_along_slope) - 0.5*(sp.rows_per_slope*sp.panel_length) + 0.5*sp.panel_length;
	z_off = col*(sp.panel_width  + sp.gap_along_length) - 0.5*(sp.panels_per_row*sp.panel_width);
}

float get_row_extent(solar_params_t const &sp) { // along the slope
	if (sp.rows_per_slope == 0) return 0.0;
	return (sp.rows_per_slope*sp.panel_length + (sp.rows_per_slope - 1)*sp.gap_along_slope);
}

void place_solar_panels(solar_params_t const &sp, frame_geom_t const &fg, vect_placed_inst_t &insts) {

	if (sp.rows_per_slope == 0 || sp.panels_per_row == 0) return; // no panels
	float const extent(get_row_extent(sp));

	if (extent > fg.slope_len) { // allowed, but the panels will overlap the ridge or hang past the eaves
		std::ostringstream oss;
		oss << "solar rows span " << extent << "m along a " << fg.slope_len << "m roof slope";
		log_warning(oss.str());
	}
	vector3d const panel_sz(sp.panel_length, sp.panel_thick, sp.panel_width);
	insts.reserve(insts.size() + get_num_panels(sp));

	for (int side = 1; side >= -1; side -= 2) { // left slope then right slope
		float const pitch(fg.get_slope_pitch(side));
		point anchor(fg.get_slope_center_x(side), (fg.get_slope_mid_y() + sp.panel_standoff), 0.0);

		if (side < 0) { // move the right slope array down-slope, away from the ridge; the mirrored rows would otherwise cross it
			anchor.x += cos(fg.pitch)*sp.overhang_fix;
			anchor.y -= sin(fg.pitch)*sp.overhang_fix;
		}
		for (unsigned row = 0; row < sp.rows_per_slope; ++row) {
			for (unsigned col = 0; col < sp.panels_per_row; ++col) {
				float x_off(0.0), z_off(0.0);
				get_panel_offsets(sp, row, col, x_off, z_off);
				if (side < 0) {x_off = -x_off;} // mirror row order about the ridge
				vector3d const offset(rotate_vector3d(vector3d(x_off, 0.0, z_off), plus_z, pitch));
				insts.emplace_back(INST_SOLAR_PANEL, (anchor + offset), panel_sz, plus_z, pitch);
			}
		} // for row
	} // for side
}
