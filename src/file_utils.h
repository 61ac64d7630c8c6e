// Facility Layout - FILE Utility Functions
// by Frank Gennari
// 10/18/26
#pragma once

#include "facility_layout.h"

inline bool is_EOF(int v) {return (v == EOF || v == '\0');}
bool read_block_comment(FILE *fp);
void skip_line_comment(FILE *fp);

inline bool read_int  (FILE *fp, int      &val) {return (fscanf(fp, "%i", &val) == 1);}
inline bool read_uint (FILE *fp, unsigned &val) {return (fscanf(fp, "%u", &val) == 1);}
inline bool read_float(FILE *fp, float    &val) {return (fscanf(fp, "%f", &val) == 1);}
inline bool read_str  (FILE *fp, char     *val) {return (fscanf(fp, "%255s", val) == 1);}

inline bool read_bool (FILE *fp, bool     &val) {
	int tmp;
	if (fscanf(fp, "%i", &tmp) != 1) return 0;
	val = (tmp != 0);
	return 1;
}

inline bool read_string(FILE *fp, std::string &str) {
	char s[MAX_CHARS] = {0};
	if (!read_str(fp, s)) return 0;
	str = s;
	return 1;
}

inline int read_ground_rect(FILE *fp, cube_t &c) { // x1 x2 z1 z2
	float x1(0.0), x2(0.0), z1(0.0), z2(0.0);
	if (fscanf(fp, "%f%f%f%f", &x1, &x2, &z1, &z2) != 4) return 0;
	c = ground_rect(min(x1, x2), max(x1, x2), min(z1, z2), max(z1, z2));
	return 1;
}


inline bool read_type_t(FILE *fp, int       &val) {return read_int   (fp, val);}
inline bool read_type_t(FILE *fp, unsigned  &val) {return read_uint  (fp, val);}
inline bool read_type_t(FILE *fp, float     &val) {return read_float (fp, val);}
inline bool read_type_t(FILE *fp, std::string &val) {return read_string(fp, val);}
inline bool read_type_t(FILE *fp, bool      &val) {return read_bool  (fp, val);}

void cfg_err(std::string const &str, int &error);


template<typename T> class kw_to_val_map_t {
	map<std::string, T*> m;
	int &error;
	std::string opt_prefix;
public:
	kw_to_val_map_t(int &error_, std::string const &opt_prefix_="") : error(error_), opt_prefix(opt_prefix_) {}

	void add(std::string const &k, T &v) {
		bool const did_ins(m.insert(make_pair(k, &v)).second);
		assert(did_ins);
	}
	bool maybe_set_from_fp(std::string const &str, FILE *fp) {
		auto it(m.find(str));
		if (it == m.end()) return 0;
		if (!read_type_t(fp, *it->second)) {cfg_err(opt_prefix + " " + str + " keyword", error);}
		return 1;
	}
};

enum {FP_CHECK_NONE=0, FP_CHECK_POS, FP_CHECK_NONNEG, FP_CHECK_01};

class kw_to_val_map_float_check_t {
	struct map_val_t {
		float *v;
		unsigned check_mode;
		map_val_t(float *v_, unsigned check_mode_) : v(v_), check_mode(check_mode_) {}
		bool check_val() const;
	};
	map<std::string, map_val_t> m;
	int &error;
	std::string opt_prefix;
public:
	kw_to_val_map_float_check_t(int &error_, std::string const &opt_prefix_="") : error(error_), opt_prefix(opt_prefix_) {}

	void add(std::string const &k, float &v, unsigned check_mode=FP_CHECK_NONE) {
		bool const did_ins(m.insert(make_pair(k, map_val_t(&v, check_mode))).second);
		assert(did_ins);
	}
	bool maybe_set_from_fp(std::string const &str, FILE *fp);
};
