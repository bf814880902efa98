/* Mappings between temporal value kinds and PostgreSQL store types.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/mapping instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_MAPPING
#define PGCHRONO_H_MAPPING

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pgchrono/value.hxx"


namespace pgchrono
{
/// Options for a @ref mapping_source.
struct PGCHRONO_LIBEXPORT mapping_options
{
  /// Map instants to `timestamp without time zone` by default, and back.
  /** This is how older schemas stored instants.  Without this option, an
   * instant goes into a `timestamp with time zone`.
   */
  bool legacy_timestamp_behavior{false};

  /// Receives a message whenever a lookup resolves through the legacy path.
  /** Notices are diagnostics, not errors.  The handler must not throw.
   */
  std::function<void(std::string_view)> notice_handler;

  /// Read options from the environment.
  /** Sets `legacy_timestamp_behavior` if `PGCHRONO_LEGACY_TIMESTAMP_BEHAVIOR`
   * is set to `1`, `true`, `on`, or `yes` (in any case).
   */
  [[nodiscard]] static mapping_options from_env();
};


/// Can a value kind go into a given store type?
enum class compatibility
{
  /// No.
  rejected,
  /// Yes.
  allowed,
  /// Only for compatibility with older schemas.
  legacy_allowed,
};


/// A resolved mapping: a value kind stored in a particular PostgreSQL type.
/** Get these from a @ref mapping_source.
 */
class PGCHRONO_LIBEXPORT type_mapping
{
public:
  [[nodiscard]] value_kind kind() const noexcept { return m_kind; }

  /// Canonical store type, e.g. `timestamp(3) with time zone`.
  [[nodiscard]] std::string const &store_type() const noexcept
  {
    return m_store_type;
  }

  /// Fractional-seconds precision facet, if one was given.
  [[nodiscard]] std::optional<int> precision() const noexcept
  {
    return m_precision;
  }

  /// The store type's OID.
  [[nodiscard]] oid type_oid() const noexcept { return m_oid; }

  /// For range and multirange types: the mapping for the element type.
  /** Returns `nullptr` for other types.
   */
  [[nodiscard]] type_mapping const *subtype() const noexcept
  {
    return m_subtype.get();
  }

  /// Does this mapping exist only for compatibility with older schemas?
  [[nodiscard]] bool is_legacy() const noexcept { return m_legacy; }

  /// Render `value` as an SQL literal of this mapping's store type.
  /** @throws usage_error if `value` is not of this mapping's kind.
   * @throws unrepresentable_value if the value does not fit the store type.
   */
  [[nodiscard]] std::string
  sql_literal(temporal_value const &value, sl loc = sl::current()) const;

private:
  friend class mapping_source;
  type_mapping(
    value_kind kind, std::string store_type, std::optional<int> precision,
    oid type_oid, std::shared_ptr<type_mapping const> subtype, bool legacy);

  value_kind m_kind;
  std::string m_store_type;
  std::optional<int> m_precision;
  oid m_oid;
  std::shared_ptr<type_mapping const> m_subtype;
  bool m_legacy;
};


/// Source of type mappings.
/** Lookups that find nothing return an empty `std::optional`; that is not an
 * error.
 *
 * Store type names are matched case-insensitively, ignoring surrounding
 * whitespace.  The short aliases `time`, `timetz`, `timestamp`, and
 * `timestamptz` work, as does a precision facet of 0 to 6 on the types that
 * take one, e.g. `timestamptz(3)`.
 */
class PGCHRONO_LIBEXPORT mapping_source
{
public:
  explicit mapping_source(mapping_options options = {});

  mapping_source(mapping_source const &) = delete;
  mapping_source &operator=(mapping_source const &) = delete;

  /// The process-wide source.  Built from the environment on first use.
  [[nodiscard]] static mapping_source const &instance();

  [[nodiscard]] mapping_options const &options() const noexcept
  {
    return m_options;
  }

  /// Default mapping for a value kind.
  [[nodiscard]] std::optional<type_mapping> find_mapping(value_kind kind) const;

  /// Default mapping for a store type.
  [[nodiscard]] std::optional<type_mapping>
  find_mapping(std::string_view store_type) const;

  /// Mapping for a value kind in a given store type, if they're compatible.
  [[nodiscard]] std::optional<type_mapping>
  find_mapping(value_kind kind, std::string_view store_type) const;

  /// Look up a value kind and store type in the compatibility table.
  [[nodiscard]] static compatibility
  compatible(value_kind kind, std::string_view store_type);

private:
  mapping_options m_options;
};
} // namespace pgchrono
#endif
