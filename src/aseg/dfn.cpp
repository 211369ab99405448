//
//  dfn.cpp
//  asegnc
//

#include "aseg/dfn.hpp"
#include "utils/linereader.hpp"
#include "utils/util.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <stdexcept>

using namespace std;

string RecordDef::marker() const
{
    for (const auto& f : fields) {
        if (f.is_record_type) return record_type;
    }
    return "";
}

const RecordDef* DfnDefinition::find_record(const string& record_type) const
{
    if (iequals(record_type, data.record_type)) return &data;
    for (const auto& r : others) {
        if (iequals(r.record_type, record_type)) return &r;
    }
    return nullptr;
}

const FieldDef* DfnDefinition::find_field(const string& name) const
{
    for (const auto& f : data.fields) {
        if (f.is_record_type) continue;
        if (iequals(f.name, name) || iequals(f.short_name, name)) return &f;
    }
    return nullptr;
}

string sanitize_name(const string& name)
{
    string out;
    out.reserve(name.size());
    for (char c : trim(name)) {
        out.push_back(isalnum((unsigned char)c) || c == '_' ? c : '_');
    }
    if (out.empty()) return "field";
    if (isdigit((unsigned char)out[0])) out.insert(out.begin(), '_');
    return out;
}

static bool is_data_record_type(const string& rt)
{
    return rt.empty() || iequals(rt, "DATA");
}

// "END  DEFN" -> true
static bool is_end_defn(const string& item)
{
    string collapsed;
    for (char c : item) {
        if (isspace((unsigned char)c)) {
            if (!collapsed.empty() && collapsed.back() != ' ') collapsed.push_back(' ');
        } else {
            collapsed.push_back((char)toupper((unsigned char)c));
        }
    }
    if (!collapsed.empty() && collapsed.back() == ' ') collapsed.pop_back();
    return collapsed == "END DEFN";
}

static void parse_attributes(FieldDef& f, const string& text, const string& where)
{
    vector<string> pieces;
    for (auto& raw : split(text, ',')) {
        string item = trim(raw);
        if (item.empty()) continue;

        size_t eq = item.find('=');
        if (eq == string::npos) {
            pieces.push_back(item);
            continue;
        }

        string key   = to_upper(trim(item.substr(0, eq)));
        string value = trim(item.substr(eq + 1));

        if (key == "NAME") {
            f.short_name = value;
        } else if (key == "UNITS" || key == "UNIT") {
            f.units = value;
        } else if (key == "LONG_NAME" || key == "LONGNAME") {
            f.long_name = value;
        } else if (key == "NULL") {
            f.null_text = value;
            double v;
            if (parse_double_strict(value, v)) {
                f.null_value = v;
            } else {
                LOG_WARN("Ignoring non-numeric NULL value '" + value + "' for field " +
                         f.name + " (" + where + ")");
            }
        } else {
            f.attributes.emplace_back(to_lower(key), value);
        }
    }

    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i) f.description += ", ";
        f.description += pieces[i];
    }
    if (f.long_name.empty()) f.long_name = f.description;
}

static FieldDef parse_field(const string& item, const string& where)
{
    FieldDef f;

    // NAME:FORMAT[:ATTRIBUTES], attributes may contain ':'
    size_t c1 = item.find(':');
    if (c1 == string::npos) {
        throw runtime_error("Missing format for field '" + item + "' (" + where + ")");
    }
    size_t c2 = item.find(':', c1 + 1);

    f.name   = trim(item.substr(0, c1));
    f.format = trim(item.substr(c1 + 1, c2 == string::npos ? string::npos : c2 - c1 - 1));

    if (f.name.empty()) {
        throw runtime_error("Empty field name (" + where + ")");
    }
    try {
        f.decoded = decode_aseg_format(f.format);
    } catch (const exception& e) {
        throw runtime_error(string(e.what()) + " for field " + f.name + " (" + where + ")");
    }
    if (f.decoded.width() <= 0) {
        throw runtime_error("Zero width format " + f.format + " for field " + f.name + " (" + where + ")");
    }

    if (c2 != string::npos) {
        parse_attributes(f, item.substr(c2 + 1), where);
    }
    f.is_record_type = iequals(f.name, "RT");
    return f;
}

static RecordDef& record_for(DfnDefinition& dfn, const string& rt)
{
    if (is_data_record_type(rt)) {
        if (dfn.data.fields.empty()) dfn.data.record_type = to_upper(rt);
        return dfn.data;
    }
    for (auto& r : dfn.others) {
        if (iequals(r.record_type, rt)) return r;
    }
    dfn.others.push_back(RecordDef{to_upper(rt), {}, 0});
    return dfn.others.back();
}

static void finish_record(RecordDef& rec, bool unique_names)
{
    int offset = 0;
    set<string> used;
    for (auto& f : rec.fields) {
        f.offset = offset;
        offset += f.width();

        if (f.short_name.empty()) f.short_name = to_lower(f.name);
        f.short_name = sanitize_name(f.short_name);

        if (unique_names && !f.is_record_type) {
            string base = f.short_name;
            for (int k = 2; used.count(f.short_name); ++k) {
                f.short_name = base + "_" + to_string(k);
            }
            if (f.short_name != base) {
                LOG_WARN("Duplicate variable name " + base + " renamed to " + f.short_name);
            }
            used.insert(f.short_name);
        }
    }
    rec.width = offset;
}

DfnDefinition parse_dfn_lines(const vector<string>& lines, const string& source)
{
    static const regex defn_re(
        R"(^\s*DEFN\s*(\d*)\s*ST\s*=\s*RECD\s*,\s*RT\s*=\s*([^;]*);(.*)$)",
        regex::icase);

    DfnDefinition dfn;
    dfn.path = source;

    bool ended = false;
    for (size_t ln = 0; ln < lines.size() && !ended; ++ln) {
        string line = lines[ln];
        strip_cr_inplace(line);
        if (trim(line).empty()) continue;

        const string where = source + ":" + to_string(ln + 1);

        smatch m;
        if (!regex_match(line, m, defn_re)) {
            if (starts_with(to_upper(trim(line)), "DEFN")) {
                throw runtime_error("Malformed definition line (" + where + "): " + line);
            }
            LOG_WARN("Skipping non-definition line (" + where + ")");
            continue;
        }

        string rt = trim(m[2].str());
        RecordDef& rec = record_for(dfn, rt);

        for (auto& raw : split(m[3].str(), ';')) {
            string item = trim(raw);
            if (item.empty()) continue;
            if (is_end_defn(item)) { ended = true; break; }
            rec.fields.push_back(parse_field(item, where));
        }
    }

    finish_record(dfn.data, true);
    for (auto& r : dfn.others) finish_record(r, false);

    size_t nfields = count_if(dfn.data.fields.begin(), dfn.data.fields.end(),
                              [](const FieldDef& f){ return !f.is_record_type; });
    if (nfields == 0) {
        throw runtime_error("No data fields defined in " + source);
    }

    LOG_INFO("Parsed " + to_string(nfields) + " data fields from " + source +
             " (record width " + to_string(dfn.data.width) + ")");
    return dfn;
}

DfnDefinition parse_dfn(const string& path)
{
    LineReader lr(path);
    vector<string> lines;
    string line;
    while (lr.getline(line)) lines.push_back(line);
    return parse_dfn_lines(lines, path);
}
