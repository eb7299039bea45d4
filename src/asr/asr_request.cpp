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
 * Session Request Builder Implementation
 */

#include "asr/asr_request.h"

#include <json-c/json.h>
#include <stdlib.h>
#include <string.h>

#include "logging.h"
#include "vasr.h"

namespace {

/* Adds key to obj, taking ownership of value. Returns false on allocation failure. */
bool add(json_object *obj, const char *key, json_object *value) {
   if (!value)
      return false;
   if (json_object_object_add(obj, key, value) != 0) {
      json_object_put(value);
      return false;
   }
   return true;
}

}  // namespace

extern "C" {

int vasr_request_build(const vasr_request_params_t *params,
                       char *reqid_out,
                       json_object **doc_out) {
   if (!params || !doc_out || !params->appid || !params->cluster || !params->token ||
       !params->language)
      return VASR_ERR_INVALID_PARAM;
   *doc_out = NULL;

   char uid[VASR_UUID_SIZE];
   char reqid[VASR_UUID_SIZE];
   if (vasr_generate_uuid(uid) != 0 || vasr_generate_uuid(reqid) != 0)
      return VASR_ERR_UNKNOWN;

   json_object *root = json_object_new_object();
   json_object *app = json_object_new_object();
   json_object *user = json_object_new_object();
   json_object *request = json_object_new_object();
   json_object *audio = json_object_new_object();

   bool ok = root && app && user && request && audio;
   if (ok) {
      ok = add(app, "appid", json_object_new_string(params->appid)) &&
           add(app, "cluster", json_object_new_string(params->cluster)) &&
           add(app, "token", json_object_new_string(params->token)) &&
           add(user, "uid", json_object_new_string(uid)) &&
           add(request, "reqid", json_object_new_string(reqid)) &&
           add(request, "show_utterances", json_object_new_boolean(0)) &&
           add(request, "sequence", json_object_new_int(1)) &&
           add(audio, "format", json_object_new_string("wav")) &&
           add(audio, "rate", json_object_new_int(VASR_SAMPLE_RATE)) &&
           add(audio, "language", json_object_new_string(params->language)) &&
           add(audio, "bits", json_object_new_int(VASR_SAMPLE_WIDTH * 8)) &&
           add(audio, "channel", json_object_new_int(VASR_CHANNELS)) &&
           add(audio, "codec", json_object_new_string("raw"));
   }

   /* add() releases the value on failure; once attached, children go with root */
   if (ok) {
      ok = add(root, "app", app);
      app = NULL;
   }
   if (ok) {
      ok = add(root, "user", user);
      user = NULL;
   }
   if (ok) {
      ok = add(root, "request", request);
      request = NULL;
   }
   if (ok) {
      ok = add(root, "audio", audio);
      audio = NULL;
   }

   if (!ok) {
      VASR_LOG_ERROR("Failed to build session request");
      json_object_put(user);
      json_object_put(request);
      json_object_put(audio);
      json_object_put(app);
      json_object_put(root);
      return VASR_ERR_OUT_OF_MEMORY;
   }

   if (reqid_out)
      safe_strncpy(reqid_out, reqid, VASR_UUID_SIZE);
   *doc_out = root;
   return VASR_SUCCESS;
}

int vasr_request_build_payload(const vasr_request_params_t *params,
                               char *reqid_out,
                               vasr_buffer_t *out) {
   if (!out)
      return VASR_ERR_INVALID_PARAM;
   out->data = NULL;
   out->len = 0;

   json_object *doc = NULL;
   int ret = vasr_request_build(params, reqid_out, &doc);
   if (ret != VASR_SUCCESS)
      return ret;

   size_t len = 0;
   const char *text = json_object_to_json_string_length(doc, JSON_C_TO_STRING_PLAIN, &len);
   if (!text) {
      json_object_put(doc);
      return VASR_ERR_OUT_OF_MEMORY;
   }

   out->data = (uint8_t *)malloc(len > 0 ? len : 1);
   if (!out->data) {
      json_object_put(doc);
      return VASR_ERR_OUT_OF_MEMORY;
   }
   memcpy(out->data, text, len);
   out->len = len;

   json_object_put(doc);
   return VASR_SUCCESS;
}

} /* extern "C" */
