/*
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
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * VASR Configuration Environment - Environment variable overrides
 */

#ifndef VASR_CONFIG_ENV_H
#define VASR_CONFIG_ENV_H

#include <stdio.h>

#include "config/vasr_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Apply environment variable overrides to configuration
 *
 * Environment variable format: VASR_<SECTION>_<KEY>
 * Examples:
 *   VASR_SERVICE_HOST=localhost
 *   VASR_SERVICE_PORT=8443
 *   VASR_AUDIO_LANGUAGE=en-US
 *
 * Secrets (highest priority):
 *   VASR_APPID -> secrets.appid
 *   VASR_ACCESS_TOKEN -> secrets.access_token
 *
 * Malformed numeric or boolean values are logged and ignored.
 *
 * @param config Config struct to modify
 */
void config_apply_env(vasr_config_t *config);

/**
 * @brief Dump configuration
 *
 * Prints all configuration values in TOML layout with secrets masked.
 * Used by --dump-config CLI option.
 *
 * @param config Configuration to dump
 * @param out Destination stream (stdout for the CLI)
 */
void config_dump(const vasr_config_t *config, FILE *out);

#ifdef __cplusplus
}
#endif

#endif /* VASR_CONFIG_ENV_H */
