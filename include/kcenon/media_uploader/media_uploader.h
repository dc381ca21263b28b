/**
 * @file media_uploader.h
 * @brief Main header for the media upload client
 *
 * Includes the client façade, request layer and batch upload components.
 */

#ifndef KCENON_MEDIA_UPLOADER_MEDIA_UPLOADER_H
#define KCENON_MEDIA_UPLOADER_MEDIA_UPLOADER_H

#include "kcenon/media_uploader/core/types.h"
#include "kcenon/media_uploader/core/version.h"
#include "kcenon/media_uploader/core/json_value.h"
#include "kcenon/media_uploader/core/logging.h"
#include "kcenon/media_uploader/core/cancellation_token.h"

#include "kcenon/media_uploader/request/http_transport.h"
#include "kcenon/media_uploader/request/request_signer.h"
#include "kcenon/media_uploader/request/retry_policy.h"
#include "kcenon/media_uploader/request/retrying_http_client.h"

#include "kcenon/media_uploader/upload/upload_source.h"
#include "kcenon/media_uploader/upload/upload_types.h"
#include "kcenon/media_uploader/upload/url_store.h"
#include "kcenon/media_uploader/upload/resumable_client.h"
#include "kcenon/media_uploader/upload/upload_listener.h"
#include "kcenon/media_uploader/upload/upload_worker.h"
#include "kcenon/media_uploader/upload/upload_coordinator.h"

#include "kcenon/media_uploader/client/client_config.h"
#include "kcenon/media_uploader/client/media_client.h"

#endif  // KCENON_MEDIA_UPLOADER_MEDIA_UPLOADER_H
