// Facility Layout - Site Objects: Gutters, Containers, Fences, and Trees
// by Frank Gennari
// 10/18/26

#include "layout.h"


unsigned get_fence_post_count(fence_run_t const &fence, float post_spacing) {
	if (!(fence.length >= 0.0) || !(post_spacing > 0.0)) return 0;
	return unsigned(floor(fence.length/post_spacing)) + 1;
}


void add_gutters(site_params_t const &sp, structure_params_t const &st, vect_placed_inst_t &insts) {

	if (!sp.add_gutters || sp.port_offsets.size() < 2) return;
	vector<float> offsets(sp.port_offsets);
	std::sort(offsets.begin(), offsets.end());
	vector3d const sz(sp.gutter_width, sp.gutter_height, st.length);

	for (unsigned i = 1; i < offsets.size(); ++i) { // in the valley between each pair of adjacent ports
		insts.emplace_back(INST_GUTTER, point(0.5*(offsets[i-1] + offsets[i]), st.eaves_height, 0.0), sz);
	}
}

void add_containers(site_params_t const &sp, structure_params_t const &st, vect_placed_inst_t &insts) {
	for (auto i = sp.containers.begin(); i != sp.containers.end(); ++i) {
		float const length((i->length > 0.0) ? i->length : st.length);
		insts.emplace_back(INST_CONTAINER, point(i->x, 0.5*i->height, i->z), vector3d(i->width, i->height, length));
	}
}

void add_fence_run(fence_run_t const &fence, site_params_t const &sp, vect_placed_inst_t &insts) {

	unsigned const num_posts(get_fence_post_count(fence, sp.post_spacing));
	float const angle(fence.rotated ? PI_TWO : 0.0), hheight(0.5*fence.height);
	point const center(fence.x, hheight, fence.z);
	vector3d const post_sz(sp.post_width, fence.height, sp.post_width);

	for (unsigned i = 0; i < num_posts; ++i) { // posts run along the local x axis
		vector3d offset(i*sp.post_spacing - 0.5*fence.length, 0.0, 0.0);
		if (fence.rotated) {offset = rotate_vector3d(offset, plus_y, angle);}
		insts.emplace_back(INST_FENCE_POST, (center + offset), post_sz, plus_y, angle);
	}
	insts.emplace_back(INST_FENCE_PANEL, center, vector3d(fence.length, fence.height, sp.fence_thick), plus_y, angle);
}

void add_trees(site_params_t const &sp, rand_source_t const &rand_src, vect_placed_inst_t &insts) {

	cube_t const &area(sp.tree_area);

	for (unsigned n = 0; n < sp.tree_attempts; ++n) {
		point pos(all_zeros);
		pos.x = area.d[0][0] + rand_src()*area.dx();
		pos.z = area.d[2][0] + rand_src()*area.dz();
		bool excluded(0);

		for (auto i = sp.tree_exclude.begin(); i != sp.tree_exclude.end() && !excluded; ++i) {
			excluded = i->contains_pt_xz(pos);
		}
		if (excluded) continue; // no retry
		float const scale(sp.tree_scale_min + rand_src()*sp.tree_scale_range);
		float const yaw(rand_src()*PI);
		insts.emplace_back(INST_TREE, pos, scale*sp.tree_size, plus_y, yaw);
	} // for n
}

void place_site_objects(site_params_t const &sp, structure_params_t const &st, rand_source_t const &rand_src, vect_placed_inst_t &insts) {
	add_gutters(sp, st, insts);
	add_containers(sp, st, insts);
	for (auto i = sp.fences.begin(); i != sp.fences.end(); ++i) {add_fence_run(*i, sp, insts);}

	if (sp.tree_attempts > 0) {
		if (!rand_src) {throw config_error_t("tree placement requires a random source");}
		add_trees(sp, rand_src, insts);
	}
}
