// rule_registry.cpp
// Parameter rule tables for each implementation type

#include <vast/rule_registry.hpp>
#include <vast/errors.hpp>
#include <stdexcept>

namespace vast {

namespace {

ParameterSpec int_param(const char* name) { return ParameterSpec{name, TypeTag::Int, {}, 'x'}; }
ParameterSpec bool_param(const char* name) { return ParameterSpec{name, TypeTag::Bool, {}, 'x'}; }
ParameterSpec str_param(const char* name) { return ParameterSpec{name, TypeTag::Str, {}, 'x'}; }
ParameterSpec url_param(const char* name) { return ParameterSpec{name, TypeTag::Url, {}, 'x'}; }
ParameterSpec size_param(const char* name) { return ParameterSpec{name, TypeTag::Size, {}, 'x'}; }

ParameterSpec enum_param(const char* name, const std::vector<std::string>& allowed) {
    return ParameterSpec{name, TypeTag::Enum, allowed, 'x'};
}

const std::vector<std::string> kEnvValues = {"vp", "instream", "outstream"};
const std::vector<std::string> kOutputValues = {"vast", "xml_vast2", "xml_vast3", "xml_vast4"};
const std::vector<std::string> kVposValues = {"preroll", "midroll", "postroll", "1", "2", "3", "0"};

std::vector<ContextRuleSet> build_rule_sets() {
    std::vector<ContextRuleSet> sets;

    // Web
    sets.push_back(ContextRuleSet{
        ImplementationType::Web,
        {
            int_param("correlator"),
            url_param("description_url"),
            enum_param("env", kEnvValues),
            int_param("gdfp_req"),
            str_param("iu"),
            enum_param("output", kOutputValues),
            size_param("sz"),
            int_param("unviewed_position_start"),
            url_param("url"),
            bool_param("vpmute"),
        },
        {
            int_param("ott_placement"),
            int_param("plcmt"),
            bool_param("vpa"),
        },
        {
            bool_param("aconp"),
            int_param("dth"),
            str_param("givn"),
            str_param("hl"),
            str_param("omid_p"),
            bool_param("vconp"),
            int_param("vid_d"),
            enum_param("vpos", kVposValues),
            int_param("wta"),
        },
    });

    // App
    sets.push_back(ContextRuleSet{
        ImplementationType::App,
        {
            int_param("correlator"),
            url_param("description_url"),
            enum_param("env", kEnvValues),
            int_param("gdfp_req"),
            str_param("iu"),
            enum_param("output", kOutputValues),
            size_param("sz"),
            int_param("unviewed_position_start"),
            url_param("url"),
            bool_param("vpmute"),
        },
        {
            int_param("idtype"),
            bool_param("is_lat"),
            int_param("ott_placement"),
            int_param("plcmt"),
            str_param("rdid"),
            bool_param("vpa"),
        },
        {
            bool_param("aconp"),
            str_param("an"),
            int_param("dth"),
            str_param("givn"),
            str_param("hl"),
            str_param("msid"),
            str_param("omid_p"),
            str_param("pvid"),
            str_param("sid"),
            bool_param("vconp"),
            int_param("vid_d"),
            enum_param("vpos", kVposValues),
            int_param("wta"),
        },
    });

    // Connected TV
    sets.push_back(ContextRuleSet{
        ImplementationType::Ctv,
        {
            int_param("correlator"),
            enum_param("env", kEnvValues),
            int_param("gdfp_req"),
            str_param("iu"),
            enum_param("output", kOutputValues),
            size_param("sz"),
            url_param("url"),
        },
        {
            int_param("idtype"),
            bool_param("is_lat"),
            int_param("ott_placement"),
            int_param("plcmt"),
            str_param("rdid"),
            bool_param("vpa"),
            bool_param("vpmute"),
        },
        {
            bool_param("aconp"),
            str_param("an"),
            int_param("dth"),
            str_param("givn"),
            str_param("hl"),
            str_param("msid"),
            str_param("omid_p"),
            str_param("sid"),
            bool_param("vconp"),
            int_param("vid_d"),
            enum_param("vpos", kVposValues),
            int_param("wta"),
        },
    });

    // Audio
    sets.push_back(ContextRuleSet{
        ImplementationType::Audio,
        {
            str_param("ad_type"),
            int_param("correlator"),
            enum_param("env", kEnvValues),
            int_param("gdfp_req"),
            str_param("iu"),
            enum_param("output", kOutputValues),
            url_param("url"),
        },
        {
            int_param("idtype"),
            bool_param("is_lat"),
            int_param("plcmt"),
            str_param("rdid"),
            bool_param("vpa"),
            bool_param("vpmute"),
        },
        {
            bool_param("aconp"),
            str_param("an"),
            int_param("dth"),
            str_param("givn"),
            str_param("hl"),
            str_param("msid"),
            str_param("omid_p"),
            str_param("sid"),
            bool_param("vconp"),
            enum_param("vpos", kVposValues),
            int_param("wta"),
        },
    });

    // Digital out-of-home
    sets.push_back(ContextRuleSet{
        ImplementationType::Doh,
        {
            int_param("correlator"),
            enum_param("env", kEnvValues),
            int_param("gdfp_req"),
            str_param("iu"),
            enum_param("output", kOutputValues),
            size_param("sz"),
            url_param("url"),
            bool_param("vpmute"),
        },
        {
            int_param("idtype"),
            bool_param("is_lat"),
            int_param("plcmt"),
            str_param("rdid"),
            str_param("sid"),
            int_param("venuetype"),
        },
        {
            bool_param("aconp"),
            str_param("an"),
            int_param("dth"),
            str_param("givn"),
            str_param("hl"),
            str_param("msid"),
            str_param("omid_p"),
        },
    });

    return sets;
}

} // namespace

const ContextRuleSet& rules_for(ImplementationType context) {
    static const std::vector<ContextRuleSet> rule_sets = build_rule_sets();
    for (size_t i = 0; i < rule_sets.size(); ++i) {
        if (rule_sets[i].context == context) return rule_sets[i];
    }
    throw std::logic_error(std::string("No rule set for implementation type ") + to_string(context));
}

const std::vector<ImplementationType>& all_implementation_types() {
    static const std::vector<ImplementationType> types = {
        ImplementationType::Web,
        ImplementationType::App,
        ImplementationType::Ctv,
        ImplementationType::Audio,
        ImplementationType::Doh,
    };
    return types;
}

ImplementationType parse_implementation_type(const std::string& token) {
    std::string allowed;
    for (size_t i = 0; i < all_implementation_types().size(); ++i) {
        ImplementationType type = all_implementation_types()[i];
        if (token == to_string(type)) return type;
        if (i > 0) allowed += ", ";
        allowed += to_string(type);
    }
    throw UsageError("Invalid implementation type: '" + token + "'. Allowed types are: " + allowed);
}

const char* to_string(ImplementationType context) {
    switch (context) {
        case ImplementationType::Web: return "web";
        case ImplementationType::App: return "app";
        case ImplementationType::Ctv: return "ctv";
        case ImplementationType::Audio: return "audio";
        case ImplementationType::Doh: return "doh";
    }
    return "unknown";
}

} // namespace vast
