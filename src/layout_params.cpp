// Facility Layout - Layout Parameter Defaults, Config File Parsing, and Validation
// by Frank Gennari
// 10/18/26

#include "layout.h"
#include "file_utils.h"


std::string const config_dir("scene_config");


parking_params_t::parking_params_t() {
	parking_class_t &car(classes[PARK_CLASS_CAR]);
	car.rows         = 2;
	car.width        = 2.4;
	car.length       = 4.8;
	car.angle_deg    = 45.0;
	car.center_x     = -6.0; // car port centerline
	car.aisle_offset = 1.5;
	car.fill_prob    = 0.7;
	car.line_width   = 0.1;
	car.start_margin = 2.0;
	car.margin_bays  = 1;
	car.occ_anchor   = OCC_ANCHOR_AISLE;
	car.model_size   = vector3d(1.9, 1.5, 4.5);

	parking_class_t &coach(classes[PARK_CLASS_COACH]);
	coach.rows             = 1;
	coach.single_side      = -1;
	coach.width            = 3.5;
	coach.length           = 12.0;
	coach.angle_deg        = 30.0;
	coach.center_x         = 6.0; // coach port centerline
	coach.aisle_offset     = -3.0;
	coach.fill_prob        = 0.6;
	coach.line_width       = 0.15;
	coach.start_margin     = 10.0;
	coach.length_reduction = 10.0;
	coach.margin_bays      = 0;
	coach.occ_anchor       = OCC_ANCHOR_SIDE;
	coach.model_size       = vector3d(2.6, 3.7, 12.0);
}

site_params_t::site_params_t() {
	port_offsets.push_back(-6.0); // car port
	port_offsets.push_back( 6.0); // coach port
	containers.emplace_back(-16.0,  0.0, 8.0, 5.0, 0.0); // full structure length
	containers.emplace_back(-16.0, 53.0, 8.0, 5.0, 7.0); // between the main container and the south fence
	// sports pitch enclosure, open on the east side facing the structures
	fences.emplace_back(-56.5, -57.5,  80.0, 3.0, 0); // north
	fences.emplace_back(-56.5,  57.5,  80.0, 3.0, 0); // south
	fences.emplace_back(-96.5,   0.0, 115.0, 3.0, 1); // west
	tree_area = ground_rect(-120.0, 30.0, -80.0, 80.0);
	tree_exclude.push_back(ground_rect( -24.0,  16.0,  -52.0,  62.0)); // structures and tarmac
	tree_exclude.push_back(ground_rect(-100.0, -10.0,  -70.0,  70.0)); // sports pitch
	tree_exclude.push_back(ground_rect(  16.0,  24.0, -100.0, 100.0)); // road
}


void throw_config_error(std::ostringstream const &oss) {throw config_error_t(oss.str());}

void layout_config_t::validate() const {

	std::ostringstream oss;
	structure_params_t const &st(structure);

	if (!(st.length > 0.0) || !(st.column_spacing > 0.0) || !(st.eaves_height > 0.0)) {
		oss << "structure dimensions must be positive (length=" << st.length << ", column_spacing=" << st.column_spacing << ", eaves_height=" << st.eaves_height << ")";
		throw_config_error(oss);
	}
	compute_frame_geom(st); // checks width and ridge height

	unsigned const col_count(get_column_count(st));

	if (col_count < 2 || col_count > MAX_REPEAT_COUNT) {
		oss << "structure needs between 2 and " << MAX_REPEAT_COUNT << " column lines (length=" << st.length << ", column_spacing=" << st.column_spacing << ")";
		throw_config_error(oss);
	}
	if (!(st.column_size > 0.0) || !(st.rafter_depth > 0.0) || !(st.rafter_thick > 0.0) || !(st.roof_thick > 0.0) || st.rafter_overhang < 0.0 || st.roof_overhang < 0.0) {
		oss << "structure member sizes must be positive";
		throw_config_error(oss);
	}
	if (!(solar.panel_width > 0.0) || !(solar.panel_length > 0.0) || !(solar.panel_thick > 0.0) || solar.gap_along_slope < 0.0 || solar.gap_along_length < 0.0) {
		oss << "solar panel dimensions must be positive (width=" << solar.panel_width << ", length=" << solar.panel_length << ")";
		throw_config_error(oss);
	}
	for (unsigned c = 0; c < NUM_PARK_CLASSES; ++c) {
		if (parking.classes[c].enabled) {check_parking_class(parking.classes[c], st.length);}
	}
	if (site.port_offsets.empty() || site.port_offsets.size() > 256) { // port index is stored in the instance tag
		oss << "site needs between 1 and 256 port offsets (count=" << site.port_offsets.size() << ")";
		throw_config_error(oss);
	}
	for (auto i = site.containers.begin(); i != site.containers.end(); ++i) {
		if (i->width > 0.0 && i->height > 0.0 && i->length >= 0.0) continue;
		oss << "container dimensions must be positive (width=" << i->width << ", height=" << i->height << ", length=" << i->length << ")";
		throw_config_error(oss);
	}
	if (!site.fences.empty() && (!(site.post_spacing > 0.0) || !(site.post_width > 0.0))) {
		oss << "fence post spacing and width must be positive (spacing=" << site.post_spacing << ", width=" << site.post_width << ")";
		throw_config_error(oss);
	}
	for (auto i = site.fences.begin(); i != site.fences.end(); ++i) {
		if (i->length >= 0.0 && i->height > 0.0) continue;
		oss << "fence dimensions must be positive (length=" << i->length << ", height=" << i->height << ")";
		throw_config_error(oss);
	}
	if (site.tree_attempts > 0 && (!(site.tree_area.dx() > 0.0) || !(site.tree_area.dz() > 0.0) || site.tree_scale_min <= 0.0 || site.tree_scale_range < 0.0)) {
		oss << "tree area must be non-empty and tree scale positive";
		throw_config_error(oss);
	}
}


// binds config fields to section keywords; must not outlive the config it was constructed with
class layout_config_reader_t {

	struct section_kw_maps_t {
		kw_to_val_map_t<bool    > kwmb;
		kw_to_val_map_t<unsigned> kwmu;
		kw_to_val_map_t<int     > kwmi;
		kw_to_val_map_float_check_t kwmr;

		section_kw_maps_t(int &error, string const &name) : kwmb(error, name), kwmu(error, name), kwmi(error, name), kwmr(error, name) {}
		bool maybe_set_from_fp(string const &str, FILE *fp) {
			return (kwmb.maybe_set_from_fp(str, fp) || kwmu.maybe_set_from_fp(str, fp) || kwmi.maybe_set_from_fp(str, fp) || kwmr.maybe_set_from_fp(str, fp));
		}
	};
	layout_config_t &cfg;
	int read_error_flag=0;
	section_kw_maps_t kw_struct, kw_solar, kw_site;
	section_kw_maps_t kw_park[NUM_PARK_CLASSES];

	static bool read_error(string const &section, string const &str) {cout << "Error reading " << section << " config option " << str << "." << endl; return 0;}
	void init_kw_maps();
	void init_park_kw_maps(section_kw_maps_t &kw, parking_class_t &pc);
	bool read_park_option(FILE *fp, unsigned cix);
	bool read_site_option(FILE *fp);
	bool read_section_option(FILE *fp, section_kw_maps_t &kw, string const &section);
public:
	layout_config_reader_t(layout_config_t &cfg_) : cfg(cfg_), kw_struct(read_error_flag, "structure"), kw_solar(read_error_flag, "solar"),
		kw_site(read_error_flag, "site"), kw_park{{read_error_flag, park_class_names[PARK_CLASS_CAR]}, {read_error_flag, park_class_names[PARK_CLASS_COACH]}}
	{
		init_kw_maps();
	}
	bool read_option(FILE *fp, string const &section);
};

void layout_config_reader_t::init_kw_maps() {
	structure_params_t &st(cfg.structure);
	kw_struct.kwmr.add("length",          st.length,          FP_CHECK_POS);
	kw_struct.kwmr.add("width",           st.width,           FP_CHECK_POS);
	kw_struct.kwmr.add("column_spacing",  st.column_spacing,  FP_CHECK_POS);
	kw_struct.kwmr.add("eaves_height",    st.eaves_height,    FP_CHECK_POS);
	kw_struct.kwmr.add("ridge_height",    st.ridge_height,    FP_CHECK_POS); // must also be above eaves_height
	kw_struct.kwmr.add("rafter_overhang", st.rafter_overhang, FP_CHECK_NONNEG);
	kw_struct.kwmr.add("roof_overhang",   st.roof_overhang,   FP_CHECK_NONNEG);
	kw_struct.kwmr.add("roof_lift",       st.roof_lift,       FP_CHECK_NONNEG);
	kw_struct.kwmr.add("column_size",     st.column_size,     FP_CHECK_POS);
	kw_struct.kwmr.add("rafter_depth",    st.rafter_depth,    FP_CHECK_POS);
	kw_struct.kwmr.add("rafter_thick",    st.rafter_thick,    FP_CHECK_POS);
	kw_struct.kwmr.add("roof_thick",      st.roof_thick,      FP_CHECK_POS);
	// solar
	solar_params_t &sp(cfg.solar);
	kw_solar.kwmu.add("rows_per_slope",   sp.rows_per_slope);
	kw_solar.kwmu.add("panels_per_row",   sp.panels_per_row);
	kw_solar.kwmr.add("panel_width",      sp.panel_width,      FP_CHECK_POS);
	kw_solar.kwmr.add("panel_length",     sp.panel_length,     FP_CHECK_POS);
	kw_solar.kwmr.add("gap_along_slope",  sp.gap_along_slope,  FP_CHECK_NONNEG);
	kw_solar.kwmr.add("gap_along_length", sp.gap_along_length, FP_CHECK_NONNEG);
	kw_solar.kwmr.add("panel_standoff",   sp.panel_standoff);
	kw_solar.kwmr.add("overhang_fix",     sp.overhang_fix); // right slope only
	kw_solar.kwmr.add("panel_thick",      sp.panel_thick,      FP_CHECK_POS);
	// parking
	for (unsigned c = 0; c < NUM_PARK_CLASSES; ++c) {init_park_kw_maps(kw_park[c], cfg.parking.classes[c]);}
	// site
	site_params_t &site(cfg.site);
	kw_site.kwmb.add("add_gutters",      site.add_gutters);
	kw_site.kwmr.add("gutter_width",     site.gutter_width,     FP_CHECK_POS);
	kw_site.kwmr.add("gutter_height",    site.gutter_height,    FP_CHECK_POS);
	kw_site.kwmr.add("post_spacing",     site.post_spacing,     FP_CHECK_POS);
	kw_site.kwmr.add("post_width",       site.post_width,       FP_CHECK_POS);
	kw_site.kwmr.add("fence_thick",      site.fence_thick,      FP_CHECK_NONNEG);
	kw_site.kwmu.add("tree_attempts",    site.tree_attempts);
	kw_site.kwmr.add("tree_scale_min",   site.tree_scale_min,   FP_CHECK_POS);
	kw_site.kwmr.add("tree_scale_range", site.tree_scale_range, FP_CHECK_NONNEG);
}

void layout_config_reader_t::init_park_kw_maps(section_kw_maps_t &kw, parking_class_t &pc) {
	kw.kwmb.add("enabled",          pc.enabled);
	kw.kwmu.add("rows",             pc.rows); // 1 or 2
	kw.kwmu.add("margin_bays",      pc.margin_bays);
	kw.kwmu.add("num_variants",     pc.num_variants);
	kw.kwmi.add("single_side",      pc.single_side); // 1 or -1
	kw.kwmr.add("width",            pc.width,            FP_CHECK_POS);
	kw.kwmr.add("length",           pc.length,           FP_CHECK_POS);
	kw.kwmr.add("angle",            pc.angle_deg); // in degrees, checked by validation
	kw.kwmr.add("center_x",         pc.center_x);
	kw.kwmr.add("aisle_offset",     pc.aisle_offset);
	kw.kwmr.add("fill_probability", pc.fill_prob,        FP_CHECK_01);
	kw.kwmr.add("line_width",       pc.line_width,       FP_CHECK_POS);
	kw.kwmr.add("marking_height",   pc.marking_height,   FP_CHECK_NONNEG);
	kw.kwmr.add("start_margin",     pc.start_margin);
	kw.kwmr.add("length_reduction", pc.length_reduction);
}

bool layout_config_reader_t::read_section_option(FILE *fp, section_kw_maps_t &kw, string const &section) {
	char strc[MAX_CHARS] = {0};
	if (!read_str(fp, strc)) return 0;
	string const str(strc);
	if (kw.maybe_set_from_fp(str, fp)) return !read_error_flag;
	cout << "Unrecognized " << section << " keyword in input file: " << str << endl;
	return 0;
}

bool layout_config_reader_t::read_park_option(FILE *fp, unsigned cix) {

	assert(cix < NUM_PARK_CLASSES);
	string const &section(park_class_names[cix]);
	parking_class_t &pc(cfg.parking.classes[cix]);
	char strc[MAX_CHARS] = {0};
	if (!read_str(fp, strc)) return 0;
	string const str(strc);
	if (kw_park[cix].maybe_set_from_fp(str, fp)) return !read_error_flag;

	if (str == "occupant_anchor") { // aisle or side
		string mode;
		if (!read_string(fp, mode)) {return read_error(section, str);}
		if      (mode == "aisle") {pc.occ_anchor = OCC_ANCHOR_AISLE;}
		else if (mode == "side" ) {pc.occ_anchor = OCC_ANCHOR_SIDE;}
		else {return read_error(section, str);}
	}
	else if (str == "model_size") { // x y z
		if (!read_float(fp, pc.model_size.x) || !read_float(fp, pc.model_size.y) || !read_float(fp, pc.model_size.z)) {return read_error(section, str);}
		if (!(pc.model_size.x > 0.0 && pc.model_size.y > 0.0 && pc.model_size.z > 0.0)) {return read_error(section, str);}
	}
	else {
		cout << "Unrecognized " << section << " keyword in input file: " << str << endl;
		return 0;
	}
	return 1;
}

bool layout_config_reader_t::read_site_option(FILE *fp) {

	site_params_t &site(cfg.site);
	char strc[MAX_CHARS] = {0};
	if (!read_str(fp, strc)) return 0;
	string const str(strc);
	if (kw_site.maybe_set_from_fp(str, fp)) return !read_error_flag;

	if (str == "port_offsets") { // <num> <x1> ... <xn>
		unsigned num(0);
		if (!read_uint(fp, num) || num == 0) {return read_error("site", str);}
		site.port_offsets.resize(num);
		for (unsigned i = 0; i < num; ++i) {
			if (!read_float(fp, site.port_offsets[i])) {return read_error("site", str);}
		}
	}
	else if (str == "container") { // <x> <z> <width> <height> <length>; length 0 = structure length
		container_t c;
		if (fscanf(fp, "%f%f%f%f%f", &c.x, &c.z, &c.width, &c.height, &c.length) != 5) {return read_error("site", str);}
		site.containers.push_back(c);
	}
	else if (str == "clear_containers") {site.containers.clear();}
	else if (str == "fence") { // <x> <z> <length> <height> <rotated>
		fence_run_t f;
		if (fscanf(fp, "%f%f%f%f", &f.x, &f.z, &f.length, &f.height) != 4 || !read_bool(fp, f.rotated)) {return read_error("site", str);}
		site.fences.push_back(f);
	}
	else if (str == "clear_fences") {site.fences.clear();}
	else if (str == "tree_area") {
		if (!read_ground_rect(fp, site.tree_area)) {return read_error("site", str);}
	}
	else if (str == "tree_exclude") {
		cube_t c;
		if (!read_ground_rect(fp, c)) {return read_error("site", str);}
		site.tree_exclude.push_back(c);
	}
	else if (str == "clear_tree_exclude") {site.tree_exclude.clear();}
	else if (str == "tree_size") { // x y z, before scaling
		if (!read_float(fp, site.tree_size.x) || !read_float(fp, site.tree_size.y) || !read_float(fp, site.tree_size.z)) {return read_error("site", str);}
	}
	else {
		cout << "Unrecognized site keyword in input file: " << str << endl;
		return 0;
	}
	return 1;
}

bool layout_config_reader_t::read_option(FILE *fp, string const &section) {
	if (section == "structure") {return read_section_option(fp, kw_struct, section);}
	if (section == "solar"    ) {return read_section_option(fp, kw_solar,  section);}
	if (section == "site"     ) {return read_site_option(fp);}

	for (unsigned c = 0; c < NUM_PARK_CLASSES; ++c) {
		if (section == park_class_names[c]) {return read_park_option(fp, c);}
	}
	assert(0); // caller only passes known sections
	return 0;
}


bool open_file(FILE *&fp, char const *const fn, string const &file_type, char const *const mode="r") {
	fp = fopen(fn, mode);
	if (fp != nullptr) return 1;
	cerr << "*** Error: Could not open " << file_type << " file '" << fn << "'." << endl;
	return 0;
}

FILE *open_config_file(string const &filename) {
	FILE *fp(fopen(filename.c_str(), "r"));
	if (fp != nullptr) return fp; // found in run dir
	if (open_file(fp, (config_dir + "/" + filename).c_str(), "input configuration file")) return fp; // found in config dir
	return nullptr; // failed
}

bool is_section_name(string const &str) {
	if (str == "structure" || str == "solar" || str == "site") return 1;
	for (unsigned c = 0; c < NUM_PARK_CLASSES; ++c) {if (str == park_class_names[c]) return 1;}
	return 0;
}

bool load_layout_config(string const &fn, layout_config_t &cfg) {

	FILE *fp(open_config_file(fn));
	if (fp == nullptr) return 0;
	int error(0);
	char strc[MAX_CHARS] = {0};
	layout_config_reader_t reader(cfg);
	kw_to_val_map_t<unsigned> kwmu(error);
	kw_to_val_map_t<bool> kwmb(error);
	kwmu.add("seed", cfg.seed);
	kwmb.add("print_timing", cfg.print_timing);

	while (read_str(fp, strc)) {
		string const str(strc);
		if (kwmu.maybe_set_from_fp(str, fp)) {if (error) break; continue;}
		if (kwmb.maybe_set_from_fp(str, fp)) {if (error) break; continue;}

		if (str.size() >= 2 && str[0] == '/' && str[1] == '*') { // start of block comment
			if (!read_block_comment(fp)) {cfg_err("block_comment", error);}
		}
		else if (str[0] == '#') { // comment
			skip_line_comment(fp);
		}
		else if (is_section_name(str)) {
			if (!reader.read_option(fp, str)) {cfg_err(str + " option", error);}
		}
		else if (str == "include") {
			string include_fname;
			if (!read_string(fp, include_fname)) {cfg_err("include", error);}
			else if (!load_layout_config(include_fname, cfg)) {cfg_err("nested include file", error);}
		}
		else if (str == "log_file") {
			string log_fname;
			if (!read_string(fp, log_fname)) {cfg_err("log_file", error);}
			else {set_log_filename(log_fname);}
		}
		else if (str == "end") {
			break;
		}
		else {
			cout << "Unrecognized keyword in input file: " << str << endl;
			error = 1;
		}
		if (error) {cout << "Parse error in config file " << fn << "." << endl; break;}
	} // while read
	fclose(fp);
	return !error;
}
