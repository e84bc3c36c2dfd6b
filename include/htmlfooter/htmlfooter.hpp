#pragma once

#include <htmlfooter/config.hpp>

#include <htmlfooter/codec/base64.hpp>
#include <htmlfooter/codec/codec.hpp>
#include <htmlfooter/codec/percent.hpp>
#include <htmlfooter/codec/quoted_printable.hpp>

#include <htmlfooter/detail/log.hpp>
#include <htmlfooter/detail/result.hpp>

#include <htmlfooter/mime/charset.hpp>
#include <htmlfooter/mime/mime.hpp>

#include <htmlfooter/footer/signature.hpp>
#include <htmlfooter/footer/classifier.hpp>
#include <htmlfooter/footer/content_id.hpp>
#include <htmlfooter/footer/html_document.hpp>
#include <htmlfooter/footer/image_resolver.hpp>
#include <htmlfooter/footer/rewrite_options.hpp>
#include <htmlfooter/footer/body_assembler.hpp>
#include <htmlfooter/footer/rewriter.hpp>
