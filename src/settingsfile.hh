/*
 * Copyright (C) 2024 The tame authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef TAME_SETTINGS_FILE_HH
#define TAME_SETTINGS_FILE_HH

#include <string>

#include "limiterconfig.hh"
#include "utils.hh"

/*
 * Settings files contain one "<name> <value>" pair per line, where name is a
 * LimiterConfig field; blank lines and # comments are ignored.
 */
Error load_settings (const std::string& filename, LimiterConfig& config);
Error save_settings (const std::string& filename, const LimiterConfig& config);

std::string settings_to_string (const LimiterConfig& config);

#endif /* TAME_SETTINGS_FILE_HH */
