#pragma once

#include <chartedit/ChartEditOptions.hpp>
#include <chartedit/core/Error.hpp>
#include <chartedit/core/Json.hpp>
#include <chartedit/skills/ChartSkills.hpp>
#include <chartedit/store/DocumentStore.hpp>
