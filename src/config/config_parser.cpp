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
 * VASR Configuration Parser - TOML file parsing (tomlc99)
 */

#include "config/config_parser.h"

#include <errno.h>
#include <limits.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <toml.h>
#include <unistd.h>

#include "logging.h"
#include "utils/string_utils.h"

namespace {

char s_loaded_path[CONFIG_PATH_MAX] = "";
char s_secrets_path[CONFIG_PATH_MAX] = "";

/* Expand a leading "~/" using $HOME. Returns false if the result does not fit. */
bool expand_path(const char *path, char *out, size_t size) {
   if (path[0] == '~' && path[1] == '/') {
      const char *home = getenv("HOME");
      if (!home || home[0] == '\0')
         return false;
      int n = snprintf(out, size, "%s%s", home, path + 1);
      return n >= 0 && (size_t)n < size;
   }
   int n = snprintf(out, size, "%s", path);
   return n >= 0 && (size_t)n < size;
}

/* =============================================================================
 * Typed value readers
 *
 * A missing key keeps the current value; a present key of the wrong type is
 * logged and ignored.
 * ============================================================================= */

void parse_string(const toml_table_t *table,
                  const char *section,
                  const char *key,
                  char *dest,
                  size_t size) {
   toml_datum_t d = toml_string_in(table, key);
   if (d.ok) {
      if (strlen(d.u.s) >= size) {
         VASR_LOG_WARNING("%s.%s is longer than %zu characters, truncating", section, key,
                          size - 1);
      }
      safe_strncpy(dest, d.u.s, size);
      free(d.u.s);
      return;
   }
   if (toml_raw_in(table, key))
      VASR_LOG_WARNING("%s.%s must be a string, ignoring", section, key);
}

void parse_int(const toml_table_t *table, const char *section, const char *key, int *dest) {
   toml_datum_t d = toml_int_in(table, key);
   if (d.ok) {
      if (d.u.i < INT_MIN || d.u.i > INT_MAX) {
         VASR_LOG_WARNING("%s.%s is out of range, ignoring", section, key);
         return;
      }
      *dest = (int)d.u.i;
      return;
   }
   if (toml_raw_in(table, key))
      VASR_LOG_WARNING("%s.%s must be an integer, ignoring", section, key);
}

void parse_bool(const toml_table_t *table, const char *section, const char *key, bool *dest) {
   toml_datum_t d = toml_bool_in(table, key);
   if (d.ok) {
      *dest = d.u.b != 0;
      return;
   }
   if (toml_raw_in(table, key))
      VASR_LOG_WARNING("%s.%s must be a boolean, ignoring", section, key);
}

/* =============================================================================
 * Section parsers
 * ============================================================================= */

void parse_general(const toml_table_t *table, general_config_t *config) {
   parse_string(table, "general", "log_file", config->log_file, sizeof(config->log_file));
   parse_string(table, "general", "log_level", config->log_level, sizeof(config->log_level));
}

void parse_service(const toml_table_t *table, service_config_t *config) {
   parse_string(table, "service", "host", config->host, sizeof(config->host));
   parse_string(table, "service", "path", config->path, sizeof(config->path));
   parse_int(table, "service", "port", &config->port);
   parse_bool(table, "service", "ssl", &config->ssl);
   parse_bool(table, "service", "ssl_verify", &config->ssl_verify);
   parse_string(table, "service", "ca_cert_path", config->ca_cert_path,
                sizeof(config->ca_cert_path));
   parse_string(table, "service", "cluster", config->cluster, sizeof(config->cluster));
   parse_int(table, "service", "success_code", &config->success_code);
   parse_int(table, "service", "connect_timeout_ms", &config->connect_timeout_ms);
   parse_int(table, "service", "receive_timeout_ms", &config->receive_timeout_ms);
}

void parse_audio(const toml_table_t *table, audio_config_t *config) {
   parse_string(table, "audio", "language", config->language, sizeof(config->language));
   parse_int(table, "audio", "segment_duration_ms", &config->segment_duration_ms);
}

void parse_output(const toml_table_t *table, output_config_t *config) {
   parse_string(table, "output", "dir", config->dir, sizeof(config->dir));
   parse_bool(table, "output", "save_audio", &config->save_audio);
}

/* Opens and parses path; caller frees the table with toml_free() */
toml_table_t *load_toml(const char *path) {
   FILE *fp = fopen(path, "r");
   if (!fp) {
      VASR_LOG_ERROR("Cannot open %s: %s", path, strerror(errno));
      return nullptr;
   }

   char errbuf[256];
   toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
   fclose(fp);

   if (!root)
      VASR_LOG_ERROR("Failed to parse %s: %s", path, errbuf);
   return root;
}

}  // namespace

extern "C" {

int config_parse_file(const char *path, vasr_config_t *config) {
   if (!path || !config)
      return 1;

   toml_table_t *root = load_toml(path);
   if (!root)
      return 1;

   const toml_table_t *section;
   if ((section = toml_table_in(root, "general")))
      parse_general(section, &config->general);
   if ((section = toml_table_in(root, "service")))
      parse_service(section, &config->service);
   if ((section = toml_table_in(root, "audio")))
      parse_audio(section, &config->audio);
   if ((section = toml_table_in(root, "output")))
      parse_output(section, &config->output);

   /* Secrets do not belong in the main config file */
   if (toml_table_in(root, "volcengine"))
      VASR_LOG_WARNING("%s has a [volcengine] section; credentials belong in secrets.toml", path);

   toml_free(root);
   return 0;
}

int config_parse_secrets(const char *path, secrets_config_t *secrets) {
   if (!path || !secrets)
      return 1;

   toml_table_t *root = load_toml(path);
   if (!root)
      return 1;

   const toml_table_t *section = toml_table_in(root, "volcengine");
   if (section) {
      parse_string(section, "volcengine", "appid", secrets->appid, sizeof(secrets->appid));
      parse_string(section, "volcengine", "access_token", secrets->access_token,
                   sizeof(secrets->access_token));
   } else {
      VASR_LOG_WARNING("%s has no [volcengine] section", path);
   }

   toml_free(root);
   return 0;
}

int config_file_readable(const char *path) {
   if (!path)
      return 0;
   char expanded[CONFIG_PATH_MAX];
   if (!expand_path(path, expanded, sizeof(expanded)))
      return 0;
   return access(expanded, R_OK) == 0;
}

int config_load_from_search(const char *explicit_path, vasr_config_t *config) {
   if (!config)
      return 1;

   char expanded[CONFIG_PATH_MAX];

   if (explicit_path && explicit_path[0] != '\0') {
      if (!expand_path(explicit_path, expanded, sizeof(expanded)) ||
          !config_file_readable(expanded)) {
         VASR_LOG_ERROR("Config file not readable: %s", explicit_path);
         return 1;
      }
      if (config_parse_file(expanded, config) != 0)
         return 1;
      safe_strncpy(s_loaded_path, expanded, sizeof(s_loaded_path));
      VASR_LOG_INFO("Loaded config from %s", expanded);
      return 0;
   }

   const char *search[] = { CONFIG_PATH_LOCAL, CONFIG_PATH_HOME, CONFIG_PATH_ETC };
   for (const char *candidate : search) {
      if (!expand_path(candidate, expanded, sizeof(expanded)) || !config_file_readable(expanded))
         continue;
      if (config_parse_file(expanded, config) != 0)
         return 1;
      safe_strncpy(s_loaded_path, expanded, sizeof(s_loaded_path));
      VASR_LOG_INFO("Loaded config from %s", expanded);
      return 0;
   }

   VASR_LOG_INFO("No config file found, using defaults");
   return 0;
}

int config_load_secrets_from_search(const char *explicit_path, secrets_config_t *secrets) {
   if (!secrets)
      return 1;

   char expanded[CONFIG_PATH_MAX];

   if (explicit_path && explicit_path[0] != '\0') {
      if (!expand_path(explicit_path, expanded, sizeof(expanded)) ||
          !config_file_readable(expanded)) {
         VASR_LOG_ERROR("Secrets file not readable: %s", explicit_path);
         return 1;
      }
      if (config_parse_secrets(expanded, secrets) != 0)
         return 1;
      safe_strncpy(s_secrets_path, expanded, sizeof(s_secrets_path));
      return 0;
   }

   const char *search[] = { SECRETS_PATH_LOCAL, SECRETS_PATH_HOME, SECRETS_PATH_ETC };
   for (const char *candidate : search) {
      if (!expand_path(candidate, expanded, sizeof(expanded)) || !config_file_readable(expanded))
         continue;
      if (config_parse_secrets(expanded, secrets) != 0)
         return 1;
      safe_strncpy(s_secrets_path, expanded, sizeof(s_secrets_path));
      VASR_LOG_INFO("Loaded secrets from %s", expanded);
      return 0;
   }

   return 0;
}

const char *config_get_loaded_path(void) {
   return s_loaded_path[0] ? s_loaded_path : "(none - using defaults)";
}

const char *config_get_secrets_path(void) {
   return s_secrets_path[0] ? s_secrets_path : "(none)";
}

} /* extern "C" */
