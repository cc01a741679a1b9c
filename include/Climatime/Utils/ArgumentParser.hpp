/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for the climatime tool.
 *
 * Supports flags, valued options with defaults, enum-backed choices (through
 * magic_enum) and generated help text.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_name, enum_values}
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace climatime::utils::argparse {
  namespace {
    using error::ClimaError;
    using enum error::ClimaErrorCode;
    using logging::Println;

    using types::Err;
    using types::Map;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;

    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) { return static_cast<char>(std::tolower(static_cast<unsigned char>(character))); });
      return text;
    }
  } // namespace

  /**
   * @brief Type alias for argument values.
   */
  using ArgValue = std::variant<bool, String>;

  /**
   * @brief Type alias for allowed choices for enum-style arguments.
   */
  using ArgChoices = Vec<String>;

  /**
   * @brief Enum string conversion through magic_enum.
   * @tparam EnumType A scoped enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(ToLower(String(magic_enum::enum_name(value))));

      return choices;
    }

    static fn stringToEnum(const StringView str) -> Option<EnumType> {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      return magic_enum::enum_cast<EnumType>(str, magic_enum::case_insensitive);
    }

    static fn enumToString(const EnumType value) -> String {
      return ToLower(String(magic_enum::enum_name(value)));
    }
  };

  /**
   * @brief Represents a command-line argument with its metadata and value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    fn defaultValue(String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Sets an enum default and restricts accepted values to the enum's names.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn choices(ArgChoices choices) -> Argument& {
      m_choices = std::move(choices);
      return *this;
    }

    /**
     * @brief Get the value of this argument.
     * @tparam T bool for flags, String for valued options
     * @return The provided value, else the default, else a value-initialized T
     */
    template <typename T>
    [[nodiscard]] fn get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] fn getPrimaryName() const -> const String& {
      return m_names.back();
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn getChoices() const -> const Option<ArgChoices>& {
      return m_choices;
    }

    /**
     * @brief Set the value for this argument, checking it against the allowed choices.
     */
    fn setValue(String value) -> Result<> {
      if (m_choices && std::ranges::none_of(*m_choices, [&](const String& choice) { return EqualsIgnoreCase(value, choice); })) {
        String allowed;

        for (const String& choice : *m_choices)
          allowed += allowed.empty() ? choice : std::format(", {}", choice);

        return Err(ClimaError(InvalidArgument, std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", value, getPrimaryName(), allowed)));
      }

      m_value  = std::move(value);
      m_isUsed = true;
      return {};
    }

    fn markUsed() -> Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

   private:
    Vec<String>        m_names;        ///< Argument names (e.g., {"-p", "--pretty"})
    String             m_helpText;     ///< Help text for this argument
    Option<ArgValue>   m_value;        ///< The actual value provided
    Option<ArgValue>   m_defaultValue; ///< Default value if none provided
    Option<ArgChoices> m_choices;      ///< Allowed choices for enum-style arguments
    bool               m_isFlag {};    ///< Whether this is a flag argument
    bool               m_isUsed {};    ///< Whether this argument was used
  };

  /**
   * @brief Main argument parser class.
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(String version, String description = "")
      : m_version(std::move(version)), m_description(std::move(description)) {
      addArguments("-h", "--help")
        .help("Show this help message and exit")
        .flag();

      addArguments("-v", "--version")
        .help("Show version information and exit")
        .flag();
    }

    /**
     * @brief Add a new argument with one or more aliases.
     * @return Reference to the newly created argument for chaining
     */
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parse command-line arguments, argv[0] included.
     * @return An InvalidArgument error for unknown options, missing values or bad choices
     */
    fn parseArgs(const Span<const char* const> args) -> Result<> {
      if (args.empty())
        return {};

      m_programName = args.front();

      for (usize i = 1; i < args.size(); ++i) {
        const StringView arg = args[i];

        const auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          return Err(ClimaError(InvalidArgument, std::format("Unknown argument: {}", arg)));

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          return Err(ClimaError(InvalidArgument, std::format("Argument {} requires a value", arg)));

        if (Result result = argument->setValue(args[++i]); !result)
          return result;
      }

      return {};
    }

    template <typename T = String>
    [[nodiscard]] fn get(const StringView name) const -> T {
      const auto iter = m_argumentMap.find(name);

      return iter != m_argumentMap.end() ? iter->second->get<T>() : T {};
    }

    /**
     * @brief Get the value of an argument as an enum type.
     * @return The enum value, or None if the stored text names no enumerator
     */
    template <typename EnumType>
      requires EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] fn getEnum(const StringView name) const -> Option<EnumType> {
      return EnumTraits<EnumType>::stringToEnum(get<String>(name));
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);

      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] fn getVersion() const -> const String& {
      return m_version;
    }

    fn printHelp() const -> Unit {
      String usage = std::format("Usage: {}", m_programName.empty() ? "climatime" : m_programName);

      for (const UniquePointer<Argument>& arg : m_arguments)
        usage += std::format(" [{}{}]", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE");

      Println(usage);

      if (!m_description.empty())
        Println("\n{}", m_description);

      Println("\nArguments:");

      for (const UniquePointer<Argument>& arg : m_arguments) {
        String names;

        for (const String& name : arg->getNames())
          names += names.empty() ? name : std::format(", {}", name);

        Println("  {}{}", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          Println("    {}", arg->getHelpText());

        if (const Option<ArgChoices>& choices = arg->getChoices()) {
          String allowed;

          for (const String& choice : *choices)
            allowed += allowed.empty() ? choice : std::format(", {}", choice);

          Println("    Available values: {}", allowed);
        }
      }
    }

   private:
    String                       m_programName; ///< Program name, taken from argv[0]
    String                       m_version;     ///< Program version
    String                       m_description; ///< One-paragraph description shown in help
    Vec<UniquePointer<Argument>> m_arguments;   ///< List of all arguments
    Map<String, Argument*>       m_argumentMap; ///< Map of argument names to arguments
  };
} // namespace climatime::utils::argparse
