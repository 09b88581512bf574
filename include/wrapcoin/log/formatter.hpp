#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <wrapcoin/encode.hpp>

namespace wrapcoin::log {

struct hex_tag
{};

// Accounts, digests and raw object keys are logged as 0x-prefixed hex
using hex = quill::BinaryData< hex_tag >;

} // namespace wrapcoin::log

template<>
struct fmtquill::formatter< wrapcoin::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const wrapcoin::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                wrapcoin::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< wrapcoin::log::hex >: quill::BinaryDataDeferredFormatCodec< wrapcoin::log::hex >
{};
