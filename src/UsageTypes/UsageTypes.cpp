#include "UsageTypes.hpp"
#include <cctype>


const char* plan_type_name(PlanType p) {
    switch (p) {
        case PlanType::Pro:    return "pro";
        case PlanType::Max5:   return "max5";
        case PlanType::Max20:  return "max20";
        case PlanType::Custom: return "custom";
    }
    return "pro";
}

// Desc: parse a plan name (case-insensitive)
// In: const std::string& s, PlanType& out
// Out: bool (false for unknown names)
bool parse_plan_type(const std::string& s, PlanType& out) {
    std::string l = s;
    for (char& c : l) c = (char)std::tolower((unsigned char)c);
    if (l == "pro")    { out = PlanType::Pro;    return true; }
    if (l == "max5")   { out = PlanType::Max5;   return true; }
    if (l == "max20")  { out = PlanType::Max20;  return true; }
    if (l == "custom") { out = PlanType::Custom; return true; }
    return false;
}

uint64_t plan_default_limit(PlanType p, uint64_t custom_limit) {
    switch (p) {
        case PlanType::Pro:    return 40000;
        case PlanType::Max5:   return 20000;
        case PlanType::Max20:  return 100000;
        case PlanType::Custom: return custom_limit;
    }
    return 40000;
}
