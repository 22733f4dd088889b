#pragma once
#include <nlohmann/json.hpp>

#include "amb/builder.h"
#include "amb/errors.h"
#include "amb/validator.h"

namespace amb {

nlohmann::json to_json(const BuildStats& st);
nlohmann::json to_json(const ValidationResult& vr);
nlohmann::json to_json(const Error& e);

} // namespace amb
