#pragma once

#include <gmailxx/config.hpp>

#include <gmailxx/codec/base64.hpp>
#include <gmailxx/codec/codec.hpp>
#include <gmailxx/codec/q_codec.hpp>
#include <gmailxx/codec/quoted_printable.hpp>

#include <gmailxx/mime/attachment_source.hpp>
#include <gmailxx/mime/composer.hpp>
#include <gmailxx/mime/date_time.hpp>
#include <gmailxx/mime/media_type.hpp>
#include <gmailxx/mime/mime.hpp>

#include <gmailxx/gmail/attachment.hpp>
#include <gmailxx/gmail/flags.hpp>
#include <gmailxx/gmail/mailbox.hpp>
#include <gmailxx/gmail/message.hpp>
#include <gmailxx/gmail/raw_parser.hpp>
#include <gmailxx/gmail/session.hpp>

#include <gmailxx/net/dialog.hpp>

#include <gmailxx/imap/error_mapping.hpp>
#include <gmailxx/imap/session.hpp>
#include <gmailxx/imap/types.hpp>
#include <gmailxx/imap/utf7.hpp>

#if GMAILXX_THROWING_ENABLED
#include <gmailxx/throwing.hpp>
#endif
