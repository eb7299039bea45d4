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
 * VASR Configuration Validation
 */

#include "config/config_validate.h"

#include <stdarg.h>
#include <stdio.h>

#include "logging.h"
#include "utils/string_utils.h"

namespace {

/* Counts every error; records only the first max_errors */
class ErrorList {
 public:
   ErrorList(config_error_t *errors, size_t max_errors) : errors_(errors), max_(max_errors) {}

   __attribute__((format(printf, 3, 4))) void add(const char *field, const char *fmt, ...) {
      if (errors_ && count_ < max_) {
         config_error_t *e = &errors_[count_];
         safe_strncpy(e->field, field, sizeof(e->field));
         va_list args;
         va_start(args, fmt);
         vsnprintf(e->message, sizeof(e->message), fmt, args);
         va_end(args);
      }
      count_++;
   }

   int count() const {
      return (int)count_;
   }

 private:
   config_error_t *errors_;
   size_t max_;
   size_t count_ = 0;
};

}  // namespace

extern "C" {

int config_validate(const vasr_config_t *config, config_error_t *errors, size_t max_errors) {
   if (!config)
      return 0;

   ErrorList list(errors, max_errors);

   /* [general] */
   vasr_log_level_t level;
   if (vasr_log_level_from_string(config->general.log_level, &level) != 0) {
      list.add("general.log_level", "unknown level \"%s\" (expected debug, info, warning, error)",
               config->general.log_level);
   }

   /* [service] */
   if (config->service.host[0] == '\0')
      list.add("service.host", "must not be empty");
   if (config->service.path[0] != '/')
      list.add("service.path", "must start with '/'");
   if (config->service.port < 1 || config->service.port > 65535)
      list.add("service.port", "must be 1-65535 (got %d)", config->service.port);
   if (config->service.cluster[0] == '\0')
      list.add("service.cluster", "required by the recognition service");
   if (config->service.connect_timeout_ms <= 0) {
      list.add("service.connect_timeout_ms", "must be positive (got %d)",
               config->service.connect_timeout_ms);
   }
   if (config->service.receive_timeout_ms <= 0) {
      list.add("service.receive_timeout_ms", "must be positive (got %d)",
               config->service.receive_timeout_ms);
   }

   /* [audio] */
   if (config->audio.language[0] == '\0')
      list.add("audio.language", "must not be empty");
   if (config->audio.segment_duration_ms <= 0) {
      list.add("audio.segment_duration_ms", "must be positive (got %d)",
               config->audio.segment_duration_ms);
   }

   /* [output] */
   if (config->output.save_audio && config->output.dir[0] == '\0')
      list.add("output.dir", "required when output.save_audio is enabled");

   /* Secrets */
   if (config->secrets.appid[0] == '\0')
      list.add("volcengine.appid", "not set (secrets.toml or VASR_APPID)");
   if (config->secrets.access_token[0] == '\0')
      list.add("volcengine.access_token", "not set (secrets.toml or VASR_ACCESS_TOKEN)");

   return list.count();
}

void config_print_errors(const config_error_t *errors, int count) {
   if (!errors || count <= 0)
      return;

   fprintf(stderr, "Configuration errors:\n");
   for (int i = 0; i < count; i++)
      fprintf(stderr, "  %s: %s\n", errors[i].field, errors[i].message);
}

} /* extern "C" */
