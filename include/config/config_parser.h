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
 * VASR Configuration Parser - TOML file parsing interface
 */

#ifndef VASR_CONFIG_PARSER_H
#define VASR_CONFIG_PARSER_H

#include "config/vasr_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Parse a TOML configuration file into a config struct
 *
 * Recognized sections: [general], [service], [audio], [output].
 * Fields not specified in the file retain their current values. A value of
 * the wrong type is logged and ignored.
 *
 * @param path Path to the TOML config file
 * @param config Config struct to populate (should be pre-initialized with defaults)
 * @return 0 on success, 1 on failure (unreadable file or TOML syntax error)
 */
int config_parse_file(const char *path, vasr_config_t *config);

/**
 * @brief Parse a secrets TOML file
 *
 * Reads appid and access_token from the [volcengine] section.
 *
 * @param path Path to the secrets TOML file
 * @param secrets Secrets struct to populate
 * @return 0 on success, 1 on failure
 */
int config_parse_secrets(const char *path, secrets_config_t *secrets);

/**
 * @brief Check if a configuration file exists and is readable
 *
 * Note: This function returns a boolean (true/false), NOT SUCCESS/FAILURE.
 *
 * @param path Path to check ("~/" is expanded)
 * @return non-zero if the file exists and is readable, 0 otherwise
 */
int config_file_readable(const char *path);

/**
 * @brief Find and load the configuration file
 *
 * Searches for config files in order:
 * 1. explicit_path (if provided; failure to load it is an error)
 * 2. ./vasr.toml
 * 3. ~/.config/vasr/vasr.toml
 * 4. /etc/vasr/vasr.toml
 *
 * @param explicit_path Explicit path from command line (NULL to use search)
 * @param config Config struct to populate
 * @return 0 on success or when no file was found (defaults kept),
 *         1 if a file was found but could not be parsed
 */
int config_load_from_search(const char *explicit_path, vasr_config_t *config);

/**
 * @brief Find and load the secrets file
 *
 * Searches explicit_path, then ./secrets.toml, ~/.config/vasr/secrets.toml
 * and /etc/vasr/secrets.toml.
 *
 * @param explicit_path Explicit path from command line (NULL to use search)
 * @param secrets Secrets struct to populate
 * @return 0 on success or when no file was found, 1 on parse failure
 */
int config_load_secrets_from_search(const char *explicit_path, secrets_config_t *secrets);

/**
 * @brief Get the path to the loaded config file
 *
 * @return Path string, or "(none - using defaults)" if no file was loaded
 */
const char *config_get_loaded_path(void);

/**
 * @brief Get the path to the loaded secrets file
 *
 * @return Path string, or "(none)" if no secrets file was loaded
 */
const char *config_get_secrets_path(void);

#ifdef __cplusplus
}
#endif

#endif /* VASR_CONFIG_PARSER_H */
