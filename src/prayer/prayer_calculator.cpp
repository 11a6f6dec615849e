/// @file prayer_calculator.cpp
/// @brief Implementation of calculate_prayer_times().

#include "prayer/prayer_calculator.hpp"

#include "prayer/prayer_time_composer.hpp"

namespace miqat::prayer
{

CalculationResult calculate_prayer_times(
    const GeoCoordinate& coordinate,
    const CalculationDate& date,
    MethodId method,
    AsrJuristic juristic)
{
    if (!coordinate.is_valid())
    {
        return CalculationError::InvalidCoordinate;
    }

    if (!date.is_valid())
    {
        return CalculationError::InvalidDate;
    }

    const auto parameters = MethodRegistry::parameters_for(method, juristic);
    if (!parameters)
    {
        return CalculationError::UnknownMethod;
    }

    return PrayerTimeComposer::compose(coordinate, date, *parameters);
}

} // namespace miqat::prayer
