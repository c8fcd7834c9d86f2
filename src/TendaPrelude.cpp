#include "TendaPrelude.hpp"
#include "TendaOperators.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <random>

namespace tenda {

// ============================================================
// Helpers
// ============================================================

using Args = std::vector<Value>;

static Diagnostic wrongArgs(const std::string &fn, const Args &args)
{
    std::vector<ValueKind> kinds;
    for (auto &a : args)
        kinds.push_back(a.kind());
    return Diagnostic::typeMismatch(fn, std::move(kinds));
}

static void define(Environment &env,
                   const std::string &name,
                   const std::vector<std::string> &params,
                   NativeFunc func,
                   bool variadic = false)
{
    env.upsert(name,
               ValueCell::owned(Value::native(makeNative(name, params, std::move(func), variadic))));
}

// Namespaced group: Lista.tamanho, Matemática.pi, ...
class Group
{
public:
    explicit Group(std::string prefix)
        : prefix_(std::move(prefix))
    {}

    void fn(const std::string &name,
            const std::vector<std::string> &params,
            NativeFunc func,
            bool variadic = false)
    {
        entries_.set(MapKey::fromText(name),
                     Value::native(makeNative(prefix_ + "." + name, params, std::move(func), variadic)));
    }

    void constant(const std::string &name, Value v) { entries_.set(MapKey::fromText(name), std::move(v)); }

    void installInto(Environment &env) { env.upsert(prefix_, ValueCell::owned(Value::map(std::move(entries_)))); }

private:
    std::string prefix_;
    ValueMap entries_;
};

// Largest list or text built from a count (Lista.de_intervalo, Texto.repita)
constexpr uint64_t MAX_BUILT_SIZE = uint64_t(1) << 24;

static std::vector<std::string> codePoints(const std::string &s)
{
    std::vector<std::string> out;
    for (size_t i = 0; i < s.size();) {
        size_t j = i + 1;
        while (j < s.size() && (static_cast<unsigned char>(s[j]) & 0xC0) == 0x80)
            ++j;
        out.push_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

static Value codePointList(const std::string &s)
{
    std::vector<Value> items;
    for (auto &c : codePoints(s))
        items.push_back(Value::text(c));
    return Value::list(std::move(items));
}

// Decimal text to number; Nada when the text is not a number
static Value parseNumber(const std::string &text)
{
    const char *begin = text.c_str();
    char *end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0')
        return Value::nil();
    return Value::number(parsed);
}

// Position inside a list of the given length, or a diagnostic
static bool position(const Value &v, size_t length, bool allowEnd, Diagnostic &err)
{
    if (!v.isInteger() || v.asNumber() < 0) {
        err = Diagnostic::invalidIndex("[]", v);
        return false;
    }
    double limit = static_cast<double>(length) + (allowEnd ? 1 : 0);
    if (v.asNumber() >= limit) {
        err = Diagnostic::indexOutOfBounds(v, length);
        return false;
    }
    return true;
}

static EvalResult lengthOf(const std::string &fn, const Args &args)
{
    auto &v = args[0];
    switch (v.kind()) {
    case ValueKind::List:
        return Value::number(static_cast<double>(v.asList().size()));
    case ValueKind::Text:
        return Value::number(static_cast<double>(utf8Length(v.asText())));
    case ValueKind::Map:
        return Value::number(static_cast<double>(v.asMap().size()));
    case ValueKind::Range:
        return Value::number(static_cast<double>(v.asRange().size()));
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Nil:
    case ValueKind::Function:
    case ValueKind::Native:
        break;
    }
    return wrongArgs(fn, args);
}

// ============================================================
// Registry
// ============================================================

void Prelude::install(Engine &engine)
{
    engine.installPrelude(bindings());
}

std::shared_ptr<const Environment> Prelude::bindings()
{
    static const std::shared_ptr<const Environment> instance = build();
    return instance;
}

std::shared_ptr<const Environment> Prelude::build()
{
    auto env = std::make_shared<Environment>();
    registerCoreFunctions(*env);
    registerIOFunctions(*env);
    registerListFunctions(*env);
    registerTextFunctions(*env);
    registerMathFunctions(*env);
    registerErrorFunctions(*env);
    return env;
}

// ============================================================
// tipo, texto, número, tamanho
// ============================================================
void Prelude::registerCoreFunctions(Environment &env)
{
    define(env, "tipo", {"valor"}, [](Engine &, Args &args) -> EvalResult {
        return Value::text(args[0].kindName());
    });

    define(env, "texto", {"valor"}, [](Engine &, Args &args) -> EvalResult {
        return Value::text(args[0].toString());
    });

    define(env, "número", {"valor"}, [](Engine &, Args &args) -> EvalResult {
        auto &v = args[0];
        if (v.isNumber())
            return v;
        if (v.isBoolean())
            return Value::number(v.asBoolean() ? 1 : 0);
        if (!v.isText())
            return wrongArgs("número", args);
        return parseNumber(v.asText());
    });

    define(env, "tamanho", {"valor"}, [](Engine &, Args &args) -> EvalResult {
        return lengthOf("tamanho", args);
    });

    env.upsert("infinito", ValueCell::owned(Value::number(std::numeric_limits<double>::infinity())));
    env.upsert("NaN", ValueCell::owned(Value::number(std::numeric_limits<double>::quiet_NaN())));
}

// ============================================================
// Entrada e saída
// ============================================================

static std::string joinDisplay(const Args &args)
{
    std::string line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0)
            line += " ";
        line += args[i].toString();
    }
    return line;
}

static EvalResult printLine(Engine &engine, Args &args)
{
    engine.output(joinDisplay(args) + "\n");
    return Value::nil();
}

static EvalResult printText(Engine &engine, Args &args)
{
    engine.output(joinDisplay(args));
    return Value::nil();
}

// Shows the optional prompt, then reads a line. Nada at end of input.
static EvalResult readLine(Engine &engine, Args &args)
{
    if (!args.empty())
        engine.output(args[0].toString());
    std::string line;
    if (!engine.input(line))
        return Value::nil();
    return Value::text(line);
}

void Prelude::registerIOFunctions(Environment &env)
{
    define(env, "exiba", {"valores"}, printLine, true);
    define(env, "escreva", {"valores"}, printText, true);
    define(env, "leia", {"mensagem?"}, readLine);
    define(env, "entrada", {}, readLine);

    Group saida("Saída");
    saida.fn("exiba", {"valores"}, printLine, true);
    saida.fn("escreva", {"valores"}, printText, true);
    saida.fn("leia", {"mensagem?"}, readLine);
    saida.fn("entrada", {}, readLine);
    saida.installInto(env);
}

// ============================================================
// Lista
// ============================================================
void Prelude::registerListFunctions(Environment &env)
{
    Group lista("Lista");

    lista.fn("tamanho", {"lista"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.tamanho", args);
        return lengthOf("Lista.tamanho", args);
    });

    // Lists are values: the operations return a new list
    lista.fn("insira", {"lista", "valor", "posição?"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.insira", args);
        auto items = args[0].asList();
        size_t at = items.size();
        if (args.size() > 2) {
            Diagnostic err;
            if (!position(args[2], items.size(), true, err))
                return err;
            at = static_cast<size_t>(args[2].asNumber());
        }
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(at), args[1]);
        return Value::list(std::move(items));
    });

    lista.fn("remova", {"lista", "posição"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.remova", args);
        auto items = args[0].asList();
        Diagnostic err;
        if (!position(args[1], items.size(), false, err))
            return err;
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(args[1].asNumber()));
        return Value::list(std::move(items));
    });

    lista.fn("fatia", {"lista", "início", "fim?"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.fatia", args);
        auto &items = args[0].asList();
        Diagnostic err;
        if (!position(args[1], items.size(), true, err))
            return err;
        size_t from = static_cast<size_t>(args[1].asNumber());
        size_t to = items.size();
        if (args.size() > 2) {
            if (!position(args[2], items.size(), true, err))
                return err;
            to = std::max(from, static_cast<size_t>(args[2].asNumber()));
        }
        return Value::list(std::vector<Value>(items.begin() + static_cast<std::ptrdiff_t>(from),
                                              items.begin() + static_cast<std::ptrdiff_t>(to)));
    });

    lista.fn("inverta", {"lista"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.inverta", args);
        auto items = args[0].asList();
        std::reverse(items.begin(), items.end());
        return Value::list(std::move(items));
    });

    lista.fn("junte", {"lista", "separador?"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList() || (args.size() > 1 && !args[1].isText()))
            return wrongArgs("Lista.junte", args);
        std::string sep = args.size() > 1 ? args[1].asText() : "";
        std::string out;
        bool first = true;
        for (auto &item : args[0].asList()) {
            if (!first)
                out += sep;
            out += item.toString();
            first = false;
        }
        return Value::text(out);
    });

    lista.fn("transforma", {"lista", "função"}, [](Engine &engine, Args &args) -> EvalResult {
        if (!args[0].isList() || !args[1].isCallable())
            return wrongArgs("Lista.transforma", args);
        std::vector<Value> out;
        out.reserve(args[0].asList().size());
        for (auto &item : args[0].asList()) {
            auto r = engine.callValue(args[1], {item});
            if (!r)
                return r;
            out.push_back(std::move(r.value()));
        }
        return Value::list(std::move(out));
    });

    lista.fn("filtra", {"lista", "função"}, [](Engine &engine, Args &args) -> EvalResult {
        if (!args[0].isList() || !args[1].isCallable())
            return wrongArgs("Lista.filtra", args);
        std::vector<Value> out;
        for (auto &item : args[0].asList()) {
            auto r = engine.callValue(args[1], {item});
            if (!r)
                return r;
            if (r.value().truthy())
                out.push_back(item);
        }
        return Value::list(std::move(out));
    });

    lista.fn("para_cada", {"lista", "função"}, [](Engine &engine, Args &args) -> EvalResult {
        if (!args[0].isList() || !args[1].isCallable())
            return wrongArgs("Lista.para_cada", args);
        for (auto &item : args[0].asList()) {
            auto r = engine.callValue(args[1], {item});
            if (!r)
                return r;
        }
        return Value::nil();
    });

    lista.fn("obtenha", {"lista", "índice"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.obtenha", args);
        auto &items = args[0].asList();
        Diagnostic err;
        if (!position(args[1], items.size(), false, err))
            return err;
        return items[static_cast<size_t>(args[1].asNumber())];
    });

    lista.fn("remova_todos", {"lista", "valor"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.remova_todos", args);
        std::vector<Value> out;
        for (auto &item : args[0].asList()) {
            if (item != args[1])
                out.push_back(item);
        }
        return Value::list(std::move(out));
    });

    lista.fn("índice_de", {"lista", "valor"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.índice_de", args);
        auto &items = args[0].asList();
        auto it = std::find(items.begin(), items.end(), args[1]);
        if (it == items.end())
            return Value::nil();
        return Value::number(static_cast<double>(it - items.begin()));
    });

    lista.fn("contém", {"lista", "valor"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.contém", args);
        auto &items = args[0].asList();
        return Value::boolean(std::find(items.begin(), items.end(), args[1]) != items.end());
    });

    lista.fn("vazio", {"lista"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.vazio", args);
        return Value::boolean(args[0].asList().empty());
    });

    lista.fn("limpa", {"lista"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isList())
            return wrongArgs("Lista.limpa", args);
        return Value::list();
    });

    lista.fn("de_intervalo", {"intervalo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isRange())
            return wrongArgs("Lista.de_intervalo", args);
        auto r = args[0].asRange();
        if (r.size() > MAX_BUILT_SIZE)
            return Diagnostic::invalidRangeBound(Value::number(static_cast<double>(r.end)));
        std::vector<Value> items;
        items.reserve(static_cast<size_t>(r.size()));
        for (uint64_t i = 0; i < r.size(); ++i)
            items.push_back(Value::number(static_cast<double>(r.start) + static_cast<double>(i)));
        return Value::list(std::move(items));
    });

    lista.fn("de_texto", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Lista.de_texto", args);
        return codePointList(args[0].asText());
    });

    lista.installInto(env);
}

// ============================================================
// Texto
// ============================================================
void Prelude::registerTextFunctions(Environment &env)
{
    Group texto("Texto");

    texto.fn("tamanho", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.tamanho", args);
        return lengthOf("Texto.tamanho", args);
    });

    texto.fn("maiúsculas", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.maiúsculas", args);
        std::string s = args[0].asText();
        for (auto &c : s)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return Value::text(s);
    });

    texto.fn("minúsculas", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.minúsculas", args);
        std::string s = args[0].asText();
        for (auto &c : s)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return Value::text(s);
    });

    texto.fn("divida", {"texto", "separador"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText() || args[1].asText().empty())
            return wrongArgs("Texto.divida", args);
        auto &s = args[0].asText();
        auto &sep = args[1].asText();
        std::vector<Value> parts;
        size_t start = 0;
        while (true) {
            size_t at = s.find(sep, start);
            if (at == std::string::npos) {
                parts.push_back(Value::text(s.substr(start)));
                break;
            }
            parts.push_back(Value::text(s.substr(start, at - start)));
            start = at + sep.size();
        }
        return Value::list(std::move(parts));
    });

    texto.fn("contém", {"texto", "trecho"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText())
            return wrongArgs("Texto.contém", args);
        return Value::boolean(args[0].asText().find(args[1].asText()) != std::string::npos);
    });

    texto.fn("apare", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.apare", args);
        auto &s = args[0].asText();
        const char *ws = " \t\r\n";
        size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos)
            return Value::text("");
        size_t last = s.find_last_not_of(ws);
        return Value::text(s.substr(first, last - first + 1));
    });

    texto.fn("vazio", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.vazio", args);
        return Value::boolean(args[0].asText().empty());
    });

    texto.fn("para_lista", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.para_lista", args);
        return codePointList(args[0].asText());
    });

    texto.fn("para_número", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.para_número", args);
        return parseNumber(args[0].asText());
    });

    texto.fn("começa_com", {"texto", "prefixo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText())
            return wrongArgs("Texto.começa_com", args);
        auto &s = args[0].asText();
        auto &prefix = args[1].asText();
        return Value::boolean(s.compare(0, prefix.size(), prefix) == 0);
    });

    texto.fn("termina_com", {"texto", "sufixo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText())
            return wrongArgs("Texto.termina_com", args);
        auto &s = args[0].asText();
        auto &suffix = args[1].asText();
        return Value::boolean(s.size() >= suffix.size()
                              && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
    });

    texto.fn("remova_prefixo", {"texto", "prefixo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText())
            return wrongArgs("Texto.remova_prefixo", args);
        auto &s = args[0].asText();
        auto &prefix = args[1].asText();
        if (s.compare(0, prefix.size(), prefix) != 0)
            return args[0];
        return Value::text(s.substr(prefix.size()));
    });

    texto.fn("remova_sufixo", {"texto", "sufixo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText())
            return wrongArgs("Texto.remova_sufixo", args);
        auto &s = args[0].asText();
        auto &suffix = args[1].asText();
        if (s.size() < suffix.size() || s.compare(s.size() - suffix.size(), suffix.size(), suffix) != 0)
            return args[0];
        return Value::text(s.substr(0, s.size() - suffix.size()));
    });

    // Position in code points, Nada when absent
    texto.fn("índice_de", {"texto", "trecho"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText())
            return wrongArgs("Texto.índice_de", args);
        auto &s = args[0].asText();
        size_t at = s.find(args[1].asText());
        if (at == std::string::npos)
            return Value::nil();
        return Value::number(static_cast<double>(utf8Length(s.substr(0, at))));
    });

    texto.fn("subtexto", {"texto", "início", "tamanho?"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.subtexto", args);
        auto chars = codePoints(args[0].asText());
        Diagnostic err;
        if (!position(args[1], chars.size(), true, err))
            return err;
        size_t from = static_cast<size_t>(args[1].asNumber());
        size_t count = chars.size() - from;
        if (args.size() > 2) {
            if (!args[2].isInteger() || args[2].asNumber() < 0)
                return Diagnostic::invalidIndex("Texto.subtexto", args[2]);
            if (args[2].asNumber() < static_cast<double>(count))
                count = static_cast<size_t>(args[2].asNumber());
        }
        std::string out;
        for (size_t i = from; i < from + count; ++i)
            out += chars[i];
        return Value::text(out);
    });

    texto.fn("inverta", {"texto"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Texto.inverta", args);
        auto chars = codePoints(args[0].asText());
        std::string out;
        for (auto it = chars.rbegin(); it != chars.rend(); ++it)
            out += *it;
        return Value::text(out);
    });

    texto.fn("repita", {"texto", "vezes"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isNumber())
            return wrongArgs("Texto.repita", args);
        if (!args[1].isInteger() || args[1].asNumber() < 0)
            return Diagnostic::invalidIndex("Texto.repita", args[1]);
        auto &s = args[0].asText();
        auto times = static_cast<uint64_t>(args[1].asNumber());
        if (!s.empty() && times > MAX_BUILT_SIZE / s.size())
            return Diagnostic::invalidIndex("Texto.repita", args[1]);
        std::string out;
        out.reserve(s.size() * static_cast<size_t>(times));
        for (uint64_t i = 0; i < times; ++i)
            out += s;
        return Value::text(out);
    });

    // Every occurrence; an empty pattern leaves the text unchanged
    texto.fn("substitua", {"texto", "antigo", "novo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText() || !args[1].isText() || !args[2].isText())
            return wrongArgs("Texto.substitua", args);
        auto &s = args[0].asText();
        auto &from = args[1].asText();
        auto &to = args[2].asText();
        if (from.empty())
            return args[0];
        std::string out;
        size_t start = 0;
        while (true) {
            size_t at = s.find(from, start);
            if (at == std::string::npos)
                break;
            out.append(s, start, at - start);
            out += to;
            start = at + from.size();
        }
        out.append(s, start, std::string::npos);
        return Value::text(out);
    });

    texto.installInto(env);
}

// ============================================================
// Matemática
// ============================================================
void Prelude::registerMathFunctions(Environment &env)
{
    Group mat("Matemática");

    mat.constant("pi", Value::number(3.14159265358979323846));
    mat.constant("e", Value::number(2.71828182845904523536));
    mat.constant("maior_número", Value::number(std::numeric_limits<double>::max()));
    mat.constant("menor_número", Value::number(-std::numeric_limits<double>::max()));

    auto unary = [&mat](const std::string &name, double (*op)(double)) {
        std::string full = "Matemática." + name;
        mat.fn(name, {"x"}, [op, full](Engine &, Args &args) -> EvalResult {
            if (!args[0].isNumber())
                return wrongArgs(full, args);
            return Value::number(op(args[0].asNumber()));
        });
    };
    unary("absoluto", [](double x) { return std::fabs(x); });
    unary("raiz", [](double x) { return std::sqrt(x); });
    unary("piso", [](double x) { return std::floor(x); });
    unary("teto", [](double x) { return std::ceil(x); });
    unary("arredonda", [](double x) { return std::round(x); });
    unary("trunca", [](double x) { return std::trunc(x); });
    unary("parte_fracionária", [](double x) { return x - std::trunc(x); });
    unary("sinal", [](double x) { return std::isnan(x) ? x : std::copysign(1.0, x); });
    unary("raiz_cúbica", [](double x) { return std::cbrt(x); });
    unary("exponencial", [](double x) { return std::exp(x); });
    unary("logaritmo_natural", [](double x) { return std::log(x); });
    unary("logaritmo_10", [](double x) { return std::log10(x); });
    unary("seno", [](double x) { return std::sin(x); });
    unary("cosseno", [](double x) { return std::cos(x); });
    unary("tangente", [](double x) { return std::tan(x); });
    unary("arco_seno", [](double x) { return std::asin(x); });
    unary("arco_cosseno", [](double x) { return std::acos(x); });
    unary("arco_tangente", [](double x) { return std::atan(x); });
    unary("seno_hiperbólico", [](double x) { return std::sinh(x); });
    unary("cosseno_hiperbólico", [](double x) { return std::cosh(x); });
    unary("tangente_hiperbólica", [](double x) { return std::tanh(x); });
    unary("arco_seno_hiperbólico", [](double x) { return std::asinh(x); });
    unary("arco_cosseno_hiperbólico", [](double x) { return std::acosh(x); });
    unary("arco_tangente_hiperbólica", [](double x) { return std::atanh(x); });
    unary("graus_para_radianos", [](double x) { return x * 3.14159265358979323846 / 180.0; });
    unary("radianos_para_graus", [](double x) { return x * 180.0 / 3.14159265358979323846; });

    auto binary = [&mat](const std::string &name,
                         const std::vector<std::string> &params,
                         double (*op)(double, double)) {
        std::string full = "Matemática." + name;
        mat.fn(name, params, [op, full](Engine &, Args &args) -> EvalResult {
            if (!args[0].isNumber() || !args[1].isNumber())
                return wrongArgs(full, args);
            return Value::number(op(args[0].asNumber(), args[1].asNumber()));
        });
    };
    binary("logaritmo", {"x", "base"}, [](double x, double base) { return std::log(x) / std::log(base); });
    binary("arco_tangente2", {"y", "x"}, [](double y, double x) { return std::atan2(y, x); });
    binary("copia_sinal", {"valor", "sinal"}, [](double v, double s) { return std::copysign(v, s); });
    binary("hipotenusa", {"a", "b"}, [](double a, double b) { return std::hypot(a, b); });

    // Same sign as the dividend, like %
    mat.fn("resto", {"dividendo", "divisor"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isNumber() || !args[1].isNumber())
            return wrongArgs("Matemática.resto", args);
        if (args[1].asNumber() == 0)
            return Diagnostic::divisionByZero();
        return Value::number(std::fmod(args[0].asNumber(), args[1].asNumber()));
    });

    // Never negative
    mat.fn("resto_euclidiano", {"dividendo", "divisor"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isNumber() || !args[1].isNumber())
            return wrongArgs("Matemática.resto_euclidiano", args);
        double d = args[1].asNumber();
        if (d == 0)
            return Diagnostic::divisionByZero();
        double r = std::fmod(args[0].asNumber(), d);
        return Value::number(r < 0 ? r + std::fabs(d) : r);
    });

    mat.fn("limita", {"x", "mínimo", "máximo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isNumber() || !args[1].isNumber() || !args[2].isNumber())
            return wrongArgs("Matemática.limita", args);
        double x = args[0].asNumber();
        if (x < args[1].asNumber())
            return args[1];
        if (x > args[2].asNumber())
            return args[2];
        return args[0];
    });

    mat.fn("fatorial", {"n"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isInteger() || args[0].asNumber() < 0)
            return wrongArgs("Matemática.fatorial", args);
        double n = args[0].asNumber();
        // 171! overflows a double
        if (n > 170)
            return Value::number(std::numeric_limits<double>::infinity());
        double result = 1;
        for (int i = 2; i <= static_cast<int>(n); ++i)
            result *= i;
        return Value::number(result);
    });

    mat.fn("aleatório", {"mínimo", "máximo"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isNumber() || !args[1].isNumber())
            return wrongArgs("Matemática.aleatório", args);
        static std::mt19937 gen(std::random_device{}());
        static std::uniform_real_distribution<double> dist(0.0, 1.0);
        double lo = args[0].asNumber();
        double hi = args[1].asNumber();
        return Value::number(lo + (hi - lo) * dist(gen));
    });

    mat.fn("potência", {"base", "expoente"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isNumber() || !args[1].isNumber())
            return wrongArgs("Matemática.potência", args);
        return Value::number(std::pow(args[0].asNumber(), args[1].asNumber()));
    });

    auto extremum = [&mat](const std::string &name, bool wantMax) {
        std::string full = "Matemática." + name;
        mat.fn(
            name,
            {"primeiro", "outros"},
            [wantMax, full](Engine &, Args &args) -> EvalResult {
                // Matemática.máximo([1, 2]) or Matemática.máximo(1, 2)
                const Args &values = args.size() == 1 && args[0].isList() ? args[0].asList()
                                                                           : args;
                if (values.empty())
                    return wrongArgs(full, args);
                double best = 0;
                for (size_t i = 0; i < values.size(); ++i) {
                    if (!values[i].isNumber())
                        return wrongArgs(full, args);
                    double x = values[i].asNumber();
                    if (i == 0 || (wantMax ? x > best : x < best))
                        best = x;
                }
                return Value::number(best);
            },
            true);
    };
    extremum("máximo", true);
    extremum("mínimo", false);

    mat.installInto(env);
}

// ============================================================
// Erro
// ============================================================
void Prelude::registerErrorFunctions(Environment &env)
{
    Group erro("Erro");

    erro.fn("crie", {"tipo", "mensagem?"}, [](Engine &, Args &args) -> EvalResult {
        if (!args[0].isText())
            return wrongArgs("Erro.crie", args);
        ValueMap err;
        err.set(MapKey::fromText("tipo"), args[0]);
        err.set(MapKey::fromText("mensagem"),
                args.size() > 1 ? Value::text(args[1].toString()) : Value::text(args[0].asText()));
        return Value::map(std::move(err));
    });

    erro.installInto(env);
}

} // namespace tenda
