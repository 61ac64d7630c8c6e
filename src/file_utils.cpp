// Facility Layout - FILE Utility Functions
// by Frank Gennari
// 10/18/26

#include "file_utils.h"


void cfg_err(string const &str, int &error) {
	cerr << "Error reading " << str << " from config file." << endl;
	error = 1;
}


bool read_block_comment(FILE *fp) {

	while (1) {
		int c(getc(fp));
		if (is_EOF(c)) return 0; // early EOF, unterminated block comment
		if (c != '*' ) continue; // not end of block comment
		while (1) {
			c = getc(fp);
			if (is_EOF(c)) return 0;
			if (c == '/') return 1; // end of block comment
			if (c != '*') break; // not "**"
		}
	}
	return 1; // never gets here
}

void skip_line_comment(FILE *fp) {
	int letter(getc(fp));
	while (letter != '\n' && letter != EOF && letter != 0) letter = getc(fp);
}


bool kw_to_val_map_float_check_t::map_val_t::check_val() const {
	switch (check_mode) {
	case FP_CHECK_NONE  : return 1;
	case FP_CHECK_POS   : return (*v > 0.0);
	case FP_CHECK_NONNEG: return (*v >= 0.0);
	case FP_CHECK_01    : return (*v >= 0.0 && *v <= 1.0);
	default: assert(0);
	}
	return 1; // never gets here
}
bool kw_to_val_map_float_check_t::maybe_set_from_fp(string const &str, FILE *fp) {
	auto it(m.find(str));
	if (it == m.end()) return 0;
	if (!read_type_t(fp, *it->second.v)) {cfg_err(opt_prefix + " " + str + " keyword", error);}
	else if (!it->second.check_val()) {cerr << "Illegal value: " << *it->second.v << "; "; cfg_err(opt_prefix + " " + str + " keyword", error);}
	return 1;
}
