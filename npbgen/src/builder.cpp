// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "builder.hpp"
#include "types.hpp"

namespace npbgen::builders {

std::string Builder::invoke_prototype(const ExportedSignature& sig)
{
  std::string s = sig.is_async ? "npbridge_future*" : abi_type(sig.success);
  s += " " + sig.invoke_symbol + "(";
  if (sig.receiver)
    s += "npbridge_object_handle self, ";
  for (const auto& p : sig.params)
    s += abi_type(p.type) + " " + p.name + ", ";
  s += "npbridge_call_status* npb_status)";
  return s;
}

std::string Builder::poll_prototype(const std::string& symbol,
                                    const ExportedSignature& sig)
{
  return "bool " + symbol +
         "(npbridge_future* handle, npbridge_completion_callback callback, "
         "void* callback_env, " +
         abi_slot_type(sig.success) + "* out, npbridge_call_status* npb_status)";
}

std::string Builder::release_prototype(const std::string& symbol)
{
  return "void " + symbol +
         "(npbridge_future* handle, npbridge_call_status* npb_status)";
}

} // namespace npbgen::builders
