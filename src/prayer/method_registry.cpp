/// @file method_registry.cpp
/// @brief The calculation-method table.

#include "prayer/method_registry.hpp"

#include <algorithm>
#include <cctype>

namespace miqat::prayer
{

namespace
{

constexpr std::array<MethodEntry, 5> kMethods = {{
    {
        .id         = MethodId::MuslimWorldLeague,
        .key        = "mwl",
        .name       = "Muslim World League",
        .parameters = {.fajr_angle_deg = 18.0, .isha = IshaAngle{17.0}},
    },
    {
        .id         = MethodId::Isna,
        .key        = "isna",
        .name       = "Islamic Society of North America",
        .parameters = {.fajr_angle_deg = 15.0, .isha = IshaAngle{15.0}},
    },
    {
        .id         = MethodId::Egypt,
        .key        = "egypt",
        .name       = "Egyptian General Authority of Survey",
        .parameters = {.fajr_angle_deg = 19.5, .isha = IshaAngle{17.5}},
    },
    {
        .id         = MethodId::UmmAlQura,
        .key        = "umm_al_qura",
        .name       = "Umm al-Qura University, Makkah",
        .parameters = {.fajr_angle_deg = 18.5, .isha = IshaInterval{90}},
    },
    {
        .id         = MethodId::Karachi,
        .key        = "karachi",
        .name       = "University of Islamic Sciences, Karachi",
        .parameters = {.fajr_angle_deg = 18.0, .isha = IshaAngle{18.0}},
    },
}};

bool equals_ignore_case(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

const MethodEntry* MethodRegistry::find(MethodId id)
{
    const auto it = std::find_if(kMethods.begin(), kMethods.end(),
                                 [id](const MethodEntry& entry) { return entry.id == id; });
    return it != kMethods.end() ? &*it : nullptr;
}

std::optional<MethodParameters> MethodRegistry::parameters_for(MethodId id)
{
    const MethodEntry* entry = find(id);
    if (entry == nullptr)
    {
        return std::nullopt;
    }
    return entry->parameters;
}

std::optional<MethodParameters> MethodRegistry::parameters_for(MethodId id, AsrJuristic juristic)
{
    auto parameters = parameters_for(id);
    if (parameters)
    {
        parameters->asr_factor = asr_factor(juristic);
    }
    return parameters;
}

std::string_view MethodRegistry::name_of(MethodId id)
{
    const MethodEntry* entry = find(id);
    return entry != nullptr ? entry->name : "Unknown";
}

std::optional<MethodId> MethodRegistry::method_from_name(std::string_view name)
{
    for (const MethodEntry& entry : kMethods)
    {
        if (equals_ignore_case(name, entry.key) || equals_ignore_case(name, entry.name))
        {
            return entry.id;
        }
    }
    return std::nullopt;
}

std::span<const MethodEntry> MethodRegistry::entries()
{
    return kMethods;
}

} // namespace miqat::prayer
