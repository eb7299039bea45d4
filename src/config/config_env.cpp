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
 * VASR Configuration Environment - Environment variable overrides and dump
 */

#include "config/config_env.h"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include "config/config_parser.h"
#include "logging.h"
#include "utils/string_utils.h"

namespace {

void env_string(const char *name, char *dest, size_t size) {
   const char *value = getenv(name);
   if (!value)
      return;
   safe_strncpy(dest, value, size);
   VASR_LOG_DEBUG("%s overrides config", name);
}

void env_int(const char *name, int *dest) {
   const char *value = getenv(name);
   if (!value)
      return;

   char *end = nullptr;
   errno = 0;
   long parsed = strtol(value, &end, 10);
   if (errno != 0 || end == value || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
      VASR_LOG_WARNING("%s=\"%s\" is not a valid integer, ignoring", name, value);
      return;
   }
   *dest = (int)parsed;
   VASR_LOG_DEBUG("%s overrides config", name);
}

void env_bool(const char *name, bool *dest) {
   const char *value = getenv(name);
   if (!value)
      return;

   if (strcasecmp(value, "true") == 0 || strcasecmp(value, "yes") == 0 ||
       strcmp(value, "1") == 0) {
      *dest = true;
   } else if (strcasecmp(value, "false") == 0 || strcasecmp(value, "no") == 0 ||
              strcmp(value, "0") == 0) {
      *dest = false;
   } else {
      VASR_LOG_WARNING("%s=\"%s\" is not a valid boolean, ignoring", name, value);
      return;
   }
   VASR_LOG_DEBUG("%s overrides config", name);
}

/* key = "value" with TOML basic-string escaping */
void dump_string(FILE *out, const char *key, const char *value) {
   fprintf(out, "%s = \"", key);
   for (const char *c = value; *c; c++) {
      switch (*c) {
         case '"':
            fputs("\\\"", out);
            break;
         case '\\':
            fputs("\\\\", out);
            break;
         case '\n':
            fputs("\\n", out);
            break;
         case '\t':
            fputs("\\t", out);
            break;
         default:
            fputc(*c, out);
      }
   }
   fputs("\"\n", out);
}

const char *bool_str(bool value) {
   return value ? "true" : "false";
}

}  // namespace

extern "C" {

void config_apply_env(vasr_config_t *config) {
   if (!config)
      return;

   /* [general] */
   env_string("VASR_GENERAL_LOG_FILE", config->general.log_file, sizeof(config->general.log_file));
   env_string("VASR_GENERAL_LOG_LEVEL", config->general.log_level,
              sizeof(config->general.log_level));

   /* [service] */
   env_string("VASR_SERVICE_HOST", config->service.host, sizeof(config->service.host));
   env_string("VASR_SERVICE_PATH", config->service.path, sizeof(config->service.path));
   env_int("VASR_SERVICE_PORT", &config->service.port);
   env_bool("VASR_SERVICE_SSL", &config->service.ssl);
   env_bool("VASR_SERVICE_SSL_VERIFY", &config->service.ssl_verify);
   env_string("VASR_SERVICE_CA_CERT_PATH", config->service.ca_cert_path,
              sizeof(config->service.ca_cert_path));
   env_string("VASR_SERVICE_CLUSTER", config->service.cluster, sizeof(config->service.cluster));
   env_int("VASR_SERVICE_SUCCESS_CODE", &config->service.success_code);
   env_int("VASR_SERVICE_CONNECT_TIMEOUT_MS", &config->service.connect_timeout_ms);
   env_int("VASR_SERVICE_RECEIVE_TIMEOUT_MS", &config->service.receive_timeout_ms);

   /* [audio] */
   env_string("VASR_AUDIO_LANGUAGE", config->audio.language, sizeof(config->audio.language));
   env_int("VASR_AUDIO_SEGMENT_DURATION_MS", &config->audio.segment_duration_ms);

   /* [output] */
   env_string("VASR_OUTPUT_DIR", config->output.dir, sizeof(config->output.dir));
   env_bool("VASR_OUTPUT_SAVE_AUDIO", &config->output.save_audio);

   /* Secrets */
   env_string("VASR_APPID", config->secrets.appid, sizeof(config->secrets.appid));
   env_string("VASR_ACCESS_TOKEN", config->secrets.access_token,
              sizeof(config->secrets.access_token));
}

void config_dump(const vasr_config_t *config, FILE *out) {
   if (!config || !out)
      return;

   char masked_appid[32];
   char masked_token[32];
   vasr_mask_secret(config->secrets.appid, masked_appid, sizeof(masked_appid));
   vasr_mask_secret(config->secrets.access_token, masked_token, sizeof(masked_token));

   fprintf(out, "# Effective configuration\n");
   fprintf(out, "# Config file:  %s\n", config_get_loaded_path());
   fprintf(out, "# Secrets file: %s\n\n", config_get_secrets_path());

   fprintf(out, "[general]\n");
   dump_string(out, "log_file", config->general.log_file);
   dump_string(out, "log_level", config->general.log_level);
   fputc('\n', out);

   fprintf(out, "[service]\n");
   dump_string(out, "host", config->service.host);
   dump_string(out, "path", config->service.path);
   fprintf(out, "port = %d\n", config->service.port);
   fprintf(out, "ssl = %s\n", bool_str(config->service.ssl));
   fprintf(out, "ssl_verify = %s\n", bool_str(config->service.ssl_verify));
   dump_string(out, "ca_cert_path", config->service.ca_cert_path);
   dump_string(out, "cluster", config->service.cluster);
   fprintf(out, "success_code = %d\n", config->service.success_code);
   fprintf(out, "connect_timeout_ms = %d\n", config->service.connect_timeout_ms);
   fprintf(out, "receive_timeout_ms = %d\n\n", config->service.receive_timeout_ms);

   fprintf(out, "[audio]\n");
   dump_string(out, "language", config->audio.language);
   fprintf(out, "segment_duration_ms = %d\n\n", config->audio.segment_duration_ms);

   fprintf(out, "[output]\n");
   dump_string(out, "dir", config->output.dir);
   fprintf(out, "save_audio = %s\n\n", bool_str(config->output.save_audio));

   fprintf(out, "[volcengine]  # secrets, masked\n");
   dump_string(out, "appid", masked_appid);
   dump_string(out, "access_token", masked_token);
}

} /* extern "C" */
