// Facility Layout - Portal Frame Structure: Columns, Rafters, and Roof Sheets
// by Frank Gennari
// 10/18/26

#include "layout.h"


unsigned get_column_count(structure_params_t const &sp) {
	if (!(sp.length > 0.0) || !(sp.column_spacing > 0.0)) return 0;
	double const num(ceil(double(sp.length)/double(sp.column_spacing)) + 1.0);
	return ((num > MAX_REPEAT_COUNT) ? (MAX_REPEAT_COUNT + 1) : unsigned(num)); // clamped before conversion
}

void build_structure(structure_params_t const &sp, frame_geom_t const &fg, vect_placed_inst_t &insts) {

	unsigned const col_count(get_column_count(sp));

	if (col_count < 2 || col_count > MAX_REPEAT_COUNT) {
		std::ostringstream oss;
		oss << "structure needs between 2 and " << MAX_REPEAT_COUNT << " column lines (length=" << sp.length << ", column_spacing=" << sp.column_spacing << ")";
		throw config_error_t(oss.str());
	}
	float const hwidth(0.5*sp.width), hlen(0.5*sp.length), slope_y(fg.get_slope_mid_y());
	vector3d const col_sz(sp.column_size, sp.eaves_height, sp.column_size), rafter_sz(fg.rafter_len, sp.rafter_depth, sp.rafter_thick);
	insts.reserve(insts.size() + 4*col_count + 2);

	for (unsigned i = 0; i < col_count; ++i) {
		float const z(i*sp.column_spacing - hlen); // the last column line may overhang +hlen; this is intentional
		insts.emplace_back(INST_COLUMN, point(-hwidth, 0.5*sp.eaves_height, z), col_sz);
		insts.emplace_back(INST_COLUMN, point( hwidth, 0.5*sp.eaves_height, z), col_sz);

		for (int side = 1; side >= -1; side -= 2) { // left, right
			insts.emplace_back(INST_RAFTER, point(fg.get_slope_center_x(side), slope_y, z), rafter_sz, plus_z, fg.get_slope_pitch(side));
		}
	} // for i
	// roof sheets span the full length once, with a small overhang at each end
	vector3d const roof_sz(fg.rafter_len, sp.roof_thick, (sp.length + sp.roof_overhang));

	for (int side = 1; side >= -1; side -= 2) {
		insts.emplace_back(INST_ROOF_SLOPE, point(fg.get_slope_center_x(side), (slope_y + sp.roof_lift), 0.0), roof_sz, plus_z, fg.get_slope_pitch(side));
	}
}
