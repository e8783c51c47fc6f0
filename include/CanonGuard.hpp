#pragma once
#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/codec/Codec.hpp"
#include "canonguard/config/SecurityConfiguration.hpp"
#include "canonguard/config/SecurityPolicy.hpp"
#include "canonguard/core/Error.hpp"
#include "canonguard/core/Exceptions.hpp"
#include "canonguard/core/ValidationErrorList.hpp"
#include "canonguard/rules/RuleRegistry.hpp"
#include "canonguard/rules/Rules.hpp"
#include "canonguard/validation/Validator.hpp"
