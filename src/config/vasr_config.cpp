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
 * VASR Configuration System - defaults
 */

#include "config/vasr_config.h"

#include <string.h>

#include "utils/string_utils.h"

extern "C" {

void vasr_config_init_defaults(vasr_config_t *config) {
   if (!config)
      return;

   memset(config, 0, sizeof(*config));

   /* General */
   config->general.log_file[0] = '\0';
   safe_strncpy(config->general.log_level, "info", sizeof(config->general.log_level));

   /* Service */
   safe_strncpy(config->service.host, VASR_DEFAULT_HOST, sizeof(config->service.host));
   safe_strncpy(config->service.path, VASR_DEFAULT_PATH, sizeof(config->service.path));
   config->service.port = VASR_DEFAULT_PORT;
   config->service.ssl = true;
   config->service.ssl_verify = true;
   config->service.ca_cert_path[0] = '\0';
   config->service.cluster[0] = '\0';
   config->service.success_code = VASR_DEFAULT_SUCCESS_CODE;
   config->service.connect_timeout_ms = VASR_DEFAULT_CONNECT_TIMEOUT_MS;
   config->service.receive_timeout_ms = VASR_DEFAULT_RECEIVE_TIMEOUT_MS;

   /* Audio */
   safe_strncpy(config->audio.language, VASR_DEFAULT_LANGUAGE, sizeof(config->audio.language));
   config->audio.segment_duration_ms = VASR_DEFAULT_SEGMENT_DURATION_MS;

   /* Output */
   config->output.dir[0] = '\0';
   config->output.save_audio = false;

   config_set_secrets_defaults(&config->secrets);
}

void config_set_secrets_defaults(secrets_config_t *secrets) {
   if (!secrets)
      return;
   memset(secrets, 0, sizeof(*secrets));
}

} /* extern "C" */
