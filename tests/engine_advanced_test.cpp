// tests/engine_advanced_test.cpp: замыкания, рекурсия, ошибки, модули, прелюдия

#include "TendaEngine.hpp"
#include "TendaPrelude.hpp"
#include "TendaReporter.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

using namespace tenda;

class AdvancedTest : public ::testing::Test
{
public:
    Engine engine;
    std::string capturedOutput;

    void SetUp() override
    {
        Prelude::install(engine);
        engine.setOutputFunc([this](const std::string &s) { capturedOutput += s; });
    }

    Value eval(const std::string &code) { return engine.eval(code); }

    double evalNumber(const std::string &code) { return eval(code).asNumber(); }

    std::string evalString(const std::string &code) { return eval(code).toString(); }

    ExecutionResult run(const std::string &code) { return engine.run(code); }
};

// ============================================================
// Замыкания
// ============================================================

class ClosureTest : public AdvancedTest
{};

TEST_F(ClosureTest, SeesLaterAssignmentToGlobal)
{
    EXPECT_DOUBLE_EQ(evalNumber("seja x = 1\nseja f = função() -> x\nx = 2\nf()"), 2.0);
}

TEST_F(ClosureTest, SeesLaterAssignmentToLocal)
{
    const char *code = "função fazer()\n"
                       "  seja x = 1\n"
                       "  seja g = função() -> x\n"
                       "  x = 2\n"
                       "  retorna g\n"
                       "fim\n"
                       "fazer()()";
    EXPECT_DOUBLE_EQ(evalNumber(code), 2.0);
}

TEST_F(ClosureTest, WritesAreVisibleToDefiningScope)
{
    const char *code = "função f()\n"
                       "  seja n = 0\n"
                       "  seja inc = função()\n"
                       "    n = n + 1\n"
                       "  fim\n"
                       "  inc()\n"
                       "  inc()\n"
                       "  retorna n\n"
                       "fim\n"
                       "f()";
    EXPECT_DOUBLE_EQ(evalNumber(code), 2.0);
}

TEST_F(ClosureTest, CountersAreIndependent)
{
    const char *code = "função contador()\n"
                       "  seja n = 0\n"
                       "  retorna função()\n"
                       "    n = n + 1\n"
                       "    retorna n\n"
                       "  fim\n"
                       "fim\n"
                       "seja a = contador()\n"
                       "seja b = contador()\n"
                       "exiba(a(), a(), b(), a())";
    eval(code);
    EXPECT_EQ(capturedOutput, "1 2 1 3\n");
}

TEST_F(ClosureTest, ParameterShadowsCapturedName)
{
    const char *code = "função externa()\n"
                       "  seja x = 10\n"
                       "  seja h = função() -> x\n"
                       "  seja g = função(x) -> x * 2\n"
                       "  retorna g(3) + h()\n"
                       "fim\n"
                       "externa()";
    EXPECT_DOUBLE_EQ(evalNumber(code), 16.0);
}

TEST_F(ClosureTest, ParameterShadowsGlobal)
{
    EXPECT_DOUBLE_EQ(evalNumber("seja x = 10\nfunção f(x) retorna x fim\nf(1)"), 1.0);
    EXPECT_DOUBLE_EQ(evalNumber("x"), 10.0);
}

TEST_F(ClosureTest, EachIterationHasItsOwnBinding)
{
    const char *code = "seja fs = []\n"
                       "para cada i em 1 até 3 faça\n"
                       "  fs = fs + [função() -> i]\n"
                       "fim\n"
                       "exiba(fs[0](), fs[1](), fs[2]())";
    eval(code);
    EXPECT_EQ(capturedOutput, "1 2 3\n");
}

TEST_F(ClosureTest, CallerLocalsAreInvisible)
{
    const char *code = "função leitor() retorna segredo fim\n"
                       "função chamador()\n"
                       "  seja segredo = 1\n"
                       "  retorna leitor()\n"
                       "fim\n"
                       "chamador()";
    auto r = run(code);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::UndefinedVariable);
    EXPECT_EQ(r.diagnostic.name, "segredo");
}

// ============================================================
// Рекурсия
// ============================================================

class RecursionTest : public AdvancedTest
{};

TEST_F(RecursionTest, AnonymousFunctionBoundWithLet)
{
    const char *code = "seja fat = função(n)\n"
                       "  se n <= 1 então\n"
                       "    retorna 1\n"
                       "  fim\n"
                       "  retorna n * fat(n - 1)\n"
                       "fim\n"
                       "fat(5)";
    EXPECT_DOUBLE_EQ(evalNumber(code), 120.0);
}

TEST_F(RecursionTest, NestedNamedFunction)
{
    const char *code = "função principal()\n"
                       "  função fib(n)\n"
                       "    se n < 2 então retorna n fim\n"
                       "    retorna fib(n - 1) + fib(n - 2)\n"
                       "  fim\n"
                       "  retorna fib(10)\n"
                       "fim\n"
                       "principal()";
    EXPECT_DOUBLE_EQ(evalNumber(code), 55.0);
}

TEST_F(RecursionTest, MutualRecursionThroughGlobals)
{
    const char *code = "função par(n)\n"
                       "  se n é 0 então retorna verdadeiro fim\n"
                       "  retorna ímpar(n - 1)\n"
                       "fim\n"
                       "função ímpar(n)\n"
                       "  se n é 0 então retorna falso fim\n"
                       "  retorna par(n - 1)\n"
                       "fim\n"
                       "par(10)";
    EXPECT_TRUE(eval(code).asBoolean());
}

TEST_F(RecursionTest, StackOverflowAtCeiling)
{
    engine.setMaxRecursionDepth(50);
    auto r = run("função f(n) retorna f(n + 1) fim\nf(0)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::StackOverflow);
    EXPECT_EQ(r.diagnostic.length, 50u);
    EXPECT_TRUE(r.diagnostic.isFatal());
    EXPECT_EQ(r.diagnostic.trace.size(), 50u);
    EXPECT_EQ(engine.stackDepth(), 0u);
}

TEST_F(RecursionTest, DepthBelowCeilingSucceeds)
{
    engine.setMaxRecursionDepth(50);
    EXPECT_DOUBLE_EQ(evalNumber("função f(n)\n se n é 0 então retorna 0 fim\n retorna f(n - 1)\nfim\nf(49)"),
                     0.0);
}

TEST_F(RecursionTest, StackOverflowIsNotCaught)
{
    engine.setMaxRecursionDepth(30);
    const char *code = "função f() retorna f() fim\n"
                       "tente\n"
                       "  f()\n"
                       "capture erro\n"
                       "  exiba(\"pego\")\n"
                       "fim";
    auto r = run(code);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::StackOverflow);
    EXPECT_TRUE(capturedOutput.empty());
    EXPECT_EQ(engine.stackDepth(), 0u);
}

TEST_F(RecursionTest, EngineIsUsableAfterOverflow)
{
    engine.setMaxRecursionDepth(20);
    EXPECT_FALSE(run("função f() retorna f() fim\nf()").ok);
    EXPECT_DOUBLE_EQ(evalNumber("1 + 1"), 2.0);
}

TEST_F(RecursionTest, NativeCallsCountTowardsCeiling)
{
    engine.setMaxRecursionDepth(1);
    auto r = run("função f() retorna tipo(1) fim\nf()");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::StackOverflow);
}

TEST_F(RecursionTest, LocalFunctionCalledFromNestedClosure)
{
    const char *code = "função g()\n"
                       "  função f(n)\n"
                       "    se n < 1 então retorna 0 fim\n"
                       "    seja h = função() -> f(n - 1)\n"
                       "    retorna h() + 1\n"
                       "  fim\n"
                       "  retorna f(3)\n"
                       "fim\n"
                       "exiba(g())";
    auto r = run(code);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(capturedOutput, "3\n");
}

TEST_F(RecursionTest, LetBoundFunctionCalledFromNestedClosure)
{
    const char *code = "função g()\n"
                       "  seja f = função(n)\n"
                       "    se n < 1 então retorna 0 fim\n"
                       "    seja h = função() -> f(n - 1)\n"
                       "    retorna h() + 1\n"
                       "  fim\n"
                       "  retorna f(3)\n"
                       "fim\n"
                       "g()";
    EXPECT_DOUBLE_EQ(evalNumber(code), 3.0);
}

TEST_F(RecursionTest, GlobalFunctionCalledFromNestedClosure)
{
    const char *code = "função f(n)\n"
                       "  se n < 1 então retorna 0 fim\n"
                       "  seja h = função() -> f(n - 1)\n"
                       "  retorna h() + 1\n"
                       "fim\n"
                       "f(3)";
    EXPECT_DOUBLE_EQ(evalNumber(code), 3.0);
}

TEST_F(RecursionTest, CeilingIsClamped)
{
    engine.setMaxRecursionDepth(1000000);
    EXPECT_EQ(engine.maxRecursionDepth(), MAX_RECURSION_DEPTH);
    engine.setMaxRecursionDepth(0);
    EXPECT_EQ(engine.maxRecursionDepth(), 1u);
}

TEST_F(RecursionTest, HighestCeilingOverflowsWithoutCrashing)
{
    engine.setMaxRecursionDepth(1000000);
    auto r = run("função f(n) retorna f(n + 1) fim\nf(0)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::StackOverflow);
    EXPECT_LE(r.diagnostic.length, MAX_RECURSION_DEPTH);
    EXPECT_EQ(engine.stackDepth(), 0u);
    EXPECT_DOUBLE_EQ(evalNumber("1 + 1"), 2.0);
}

TEST_F(RecursionTest, StackBudgetLimitsDepth)
{
    engine.setStackBudget(64 * 1024);
    auto r = run("função f(n) retorna f(n + 1) fim\nf(0)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::StackOverflow);
    EXPECT_LT(r.diagnostic.length, 500u);
    EXPECT_EQ(engine.stackDepth(), 0u);
}

// ============================================================
// Ошибки: tente / capture / lance
// ============================================================

class ErrorHandlingTest : public AdvancedTest
{};

TEST_F(ErrorHandlingTest, CatchesRuntimeErrorsInsideLoop)
{
    const char *code = "seja total = 0\n"
                       "para cada i em [1, 0, 2] faça\n"
                       "  tente\n"
                       "    total = total + 10 / i\n"
                       "  capture erro\n"
                       "    exiba(erro.tipo)\n"
                       "  fim\n"
                       "fim\n"
                       "total";
    EXPECT_DOUBLE_EQ(evalNumber(code), 15.0);
    EXPECT_EQ(capturedOutput, "DivisãoPorZero\n");
}

TEST_F(ErrorHandlingTest, CaughtRuntimeErrorHasMessage)
{
    eval("tente\n  indefinida\ncapture erro\n  exiba(erro.mensagem)\nfim");
    EXPECT_EQ(capturedOutput, "a variável 'indefinida' não está definida\n");
}

TEST_F(ErrorHandlingTest, RaisedValueIsBoundAsIs)
{
    eval("tente\n  lance Erro.crie(\"Meu\", \"falhou\")\ncapture erro\n  exiba(erro.tipo, erro.mensagem)\nfim");
    eval("tente\n  lance 42\ncapture x\n  exiba(x + 1)\nfim");
    EXPECT_EQ(capturedOutput, "Meu falhou\n43\n");
}

TEST_F(ErrorHandlingTest, CatchWithoutName)
{
    eval("tente\n  lance \"x\"\ncapture\n  exiba(\"ok\")\nfim");
    EXPECT_EQ(capturedOutput, "ok\n");
}

TEST_F(ErrorHandlingTest, CatchNameIsScopedToHandler)
{
    auto r = run("tente\n  lance 1\ncapture erro\nfim\nerro");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::UndefinedVariable);
}

TEST_F(ErrorHandlingTest, UncaughtRaise)
{
    auto r = run("\nlance \"ops\"");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::UserRaised);
    EXPECT_EQ(r.diagnostic.payload, Value::text("ops"));
    EXPECT_EQ(r.diagnostic.span.line, 2);
    EXPECT_EQ(Reporter::describe(r.diagnostic), "ops");
}

TEST_F(ErrorHandlingTest, ErrorInsideHandlerPropagates)
{
    auto r = run("tente\n  lance 1\ncapture\n  1 / 0\nfim");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::DivisionByZero);
}

TEST_F(ErrorHandlingTest, ReturnPassesThroughTry)
{
    const char *code = "função f()\n"
                       "  tente\n"
                       "    retorna 7\n"
                       "  capture\n"
                       "    retorna 0\n"
                       "  fim\n"
                       "fim\n"
                       "f()";
    EXPECT_DOUBLE_EQ(evalNumber(code), 7.0);
}

TEST_F(ErrorHandlingTest, TracebackNamesFunctions)
{
    const char *code = "função a() lance \"x\" fim\n"
                       "função b() a() fim\n"
                       "seja c = função() -> b()\n"
                       "c()";
    auto r = run(code);
    ASSERT_FALSE(r.ok);
    ASSERT_EQ(r.diagnostic.trace.size(), 3u);
    EXPECT_EQ(r.diagnostic.trace[0].function, "a");
    EXPECT_EQ(r.diagnostic.trace[1].function, "b");
    EXPECT_EQ(r.diagnostic.trace[2].function, "c");
    EXPECT_EQ(r.diagnostic.trace[2].span.line, 4);
}

TEST_F(ErrorHandlingTest, FramesAreBalancedAfterErrors)
{
    eval("função fundo(n)\n se n é 0 então retorna [][1] fim\n retorna fundo(n - 1)\nfim");
    EXPECT_FALSE(run("fundo(10)").ok);
    EXPECT_EQ(engine.stackDepth(), 0u);
    EXPECT_FALSE(run("para cada i em 1 até 3 faça faça lance i fim fim").ok);
    EXPECT_EQ(engine.stackDepth(), 0u);
}

// ============================================================
// Индексация и семантика значений
// ============================================================

class IndexingTest : public AdvancedTest
{};

TEST_F(IndexingTest, ReadAccess)
{
    EXPECT_DOUBLE_EQ(evalNumber("[10, 20, 30][1]"), 20.0);
    EXPECT_DOUBLE_EQ(evalNumber("{\"a\": 1, 2: 5}[2]"), 5.0);
    EXPECT_DOUBLE_EQ(evalNumber("{\"a\": 1}.a"), 1.0);
    EXPECT_DOUBLE_EQ(evalNumber("(1 até 5)[1]"), 2.0);
}

TEST_F(IndexingTest, Errors)
{
    EXPECT_EQ(run("[1][5]").diagnostic.kind, DiagnosticKind::IndexOutOfBounds);
    EXPECT_EQ(run("[1][-1]").diagnostic.kind, DiagnosticKind::InvalidIndex);
    EXPECT_EQ(run("[1][0.5]").diagnostic.kind, DiagnosticKind::InvalidIndex);
    EXPECT_EQ(run("{\"a\": 1}[\"b\"]").diagnostic.kind, DiagnosticKind::KeyNotFound);
    EXPECT_EQ(run("1[0]").diagnostic.kind, DiagnosticKind::TypeMismatch);
    EXPECT_EQ(run("seja t = \"abc\"\nt[0] = \"x\"").diagnostic.kind, DiagnosticKind::TypeMismatch);
}

TEST_F(IndexingTest, ListsHaveValueSemantics)
{
    eval("seja a = [1, 2]\nseja b = a\nb[0] = 9\nexiba(a, b)");
    EXPECT_EQ(capturedOutput, "[1, 2] [9, 2]\n");
}

TEST_F(IndexingTest, ArgumentsAreCopies)
{
    eval("função muda(l) l[0] = 0 fim\nseja l = [1]\nmuda(l)\nexiba(l)");
    EXPECT_EQ(capturedOutput, "[1]\n");
}

TEST_F(IndexingTest, NestedStore)
{
    EXPECT_DOUBLE_EQ(evalNumber("seja m = {\"l\": [1, 2]}\nm[\"l\"][1] = 5\nm.l[1]"), 5.0);
}

TEST_F(IndexingTest, FieldStoreAddsKey)
{
    EXPECT_EQ(evalString("seja d = {}\nd.nome = \"x\"\nd[3] = 1\nd"), "{\"nome\": \"x\", 3: 1}");
}

TEST_F(IndexingTest, Membership)
{
    EXPECT_TRUE(eval("[1, 2] tem 2").asBoolean());
    EXPECT_TRUE(eval("{\"a\": 1} tem \"a\"").asBoolean());
    EXPECT_TRUE(eval("\"banana\" tem \"nan\"").asBoolean());
    EXPECT_TRUE(eval("(1 até 3) tem 3").asBoolean());
    EXPECT_FALSE(eval("(1 até 3) tem 1.5").asBoolean());
    EXPECT_FALSE(eval("[1] não tem 1").asBoolean());
    EXPECT_EQ(run("1 tem 1").diagnostic.kind, DiagnosticKind::TypeMismatch);
}

TEST_F(IndexingTest, HugeRangeIsWalkedLazily)
{
    EXPECT_TRUE(run("para cada i em 1 até 10^15 faça pare fim").ok);
    const char *code = "seja n = 0\n"
                       "para cada i em 1 até 10^15 faça\n"
                       "  n = n + i\n"
                       "  se i é 3 então pare fim\n"
                       "fim\n"
                       "n";
    EXPECT_DOUBLE_EQ(evalNumber(code), 6.0);
    EXPECT_TRUE(eval("(1 até 10^15) tem 10^15").asBoolean());
    EXPECT_DOUBLE_EQ(evalNumber("(1 até 10^15)[10^15 - 1]"), 1e15);
}

TEST_F(IndexingTest, InexactBoundsAndKeysAreRejected)
{
    EXPECT_EQ(run("1 até 10^300").diagnostic.kind, DiagnosticKind::InvalidRangeBound);
    EXPECT_EQ(run("tamanho(0 - 2^62 - 2^62 até 2^62)").diagnostic.kind,
              DiagnosticKind::InvalidRangeBound);
    EXPECT_EQ(run("{10^300: 1}").diagnostic.kind, DiagnosticKind::InvalidIndex);
    EXPECT_EQ(run("[1][2^60]").diagnostic.kind, DiagnosticKind::InvalidIndex);
    EXPECT_EQ(run("{\"a\": 1}[2^60]").diagnostic.kind, DiagnosticKind::InvalidIndex);
}

TEST_F(IndexingTest, WidestRangeSize)
{
    // 2^54 + 1 elements, reported as the nearest number
    EXPECT_DOUBLE_EQ(evalNumber("tamanho(0 - 2^53 até 2^53)"), 18014398509481984.0);
    EXPECT_EQ(run("[1][2^53]").diagnostic.kind, DiagnosticKind::IndexOutOfBounds);
}

// ============================================================
// Модули
// ============================================================

class ModuleTest : public AdvancedTest
{
public:
    std::map<std::string, std::string> files;

    void SetUp() override
    {
        AdvancedTest::SetUp();
        engine.setModuleResolver([this](const std::string &id, std::string &source) {
            auto it = files.find(id);
            if (it == files.end())
                return false;
            source = it->second;
            return true;
        });
    }
};

TEST_F(ModuleTest, ImportsExportedBindings)
{
    files["util"] = "exporte função dobro(x) retorna x * 2 fim\n"
                    "exporte seja nome = \"util\"\n"
                    "seja privado = 1";
    EXPECT_DOUBLE_EQ(evalNumber("importe \"util\"\ndobro(21)"), 42.0);
    EXPECT_EQ(evalString("nome"), "util");
    EXPECT_EQ(run("privado").diagnostic.kind, DiagnosticKind::UndefinedVariable);
}

TEST_F(ModuleTest, FunctionsSeeTheirModuleGlobals)
{
    files["util"] = "seja fator = 3\nexporte função vezes(x) retorna x * fator fim";
    EXPECT_DOUBLE_EQ(evalNumber("seja fator = 100\nimporte \"util\"\nvezes(2)"), 6.0);
}

TEST_F(ModuleTest, ExportedStateIsShared)
{
    files["estado"] = "exporte seja contador = 0\n"
                      "exporte função incrementa()\n"
                      "  contador = contador + 1\n"
                      "fim";
    EXPECT_DOUBLE_EQ(evalNumber("importe \"estado\"\nincrementa()\nincrementa()\ncontador"), 2.0);
}

TEST_F(ModuleTest, ModuleRunsOnce)
{
    files["comum"] = "exiba(\"carregado\")";
    files["a"] = "importe \"comum\"\nexporte seja a = 1";
    files["b"] = "importe \"comum\"\nexporte seja b = 2";
    EXPECT_DOUBLE_EQ(evalNumber("importe \"a\"\nimporte \"b\"\na + b"), 3.0);
    EXPECT_EQ(capturedOutput, "carregado\n");
}

TEST_F(ModuleTest, ModuleNotFound)
{
    auto r = run("importe \"nada\"");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::ModuleNotFound);
    EXPECT_EQ(r.diagnostic.name, "nada");
}

TEST_F(ModuleTest, ImportCycle)
{
    files["a"] = "importe \"b\"";
    files["b"] = "importe \"a\"";
    EXPECT_EQ(run("importe \"a\"").diagnostic.kind, DiagnosticKind::ImportCycle);
    EXPECT_EQ(engine.stackDepth(), 0u);
}

TEST_F(ModuleTest, InvalidModule)
{
    files["ruim"] = "seja = 1";
    auto r = run("importe \"ruim\"");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::InvalidModule);
    EXPECT_EQ(r.diagnostic.name, "ruim");
    EXPECT_FALSE(r.diagnostic.detail.empty());
    EXPECT_EQ(r.diagnostic.detail.find("linha"), std::string::npos);
    EXPECT_EQ(r.diagnostic.origin.line, 1);
    EXPECT_EQ(r.diagnostic.origin.col, 6);
    EXPECT_NE(Reporter::describe(r.diagnostic).find("(linha 1, coluna 6)"), std::string::npos);
}

TEST_F(ModuleTest, FailingModuleCanBeRetried)
{
    files["frágil"] = "exporte seja x = 1 / falhar";
    EXPECT_EQ(run("importe \"frágil\"").diagnostic.kind, DiagnosticKind::UndefinedVariable);
    files["frágil"] = "exporte seja x = 1";
    EXPECT_DOUBLE_EQ(evalNumber("importe \"frágil\"\nx"), 1.0);
}

TEST_F(ModuleTest, ImportConflictsWithExistingName)
{
    files["util"] = "exporte seja x = 1";
    EXPECT_EQ(run("seja x = 0\nimporte \"util\"").diagnostic.kind, DiagnosticKind::AlreadyDeclared);
}

// ============================================================
// Прелюдия
// ============================================================

class PreludeTest : public AdvancedTest
{};

TEST_F(PreludeTest, CoreFunctions)
{
    EXPECT_EQ(evalString("tipo(1)"), "número");
    EXPECT_EQ(evalString("tipo([])"), "lista");
    EXPECT_EQ(evalString("tipo(Nada)"), "Nada");
    EXPECT_EQ(evalString("tipo(exiba)"), "função");
    EXPECT_EQ(evalString("texto(3.5)"), "3.5");
    EXPECT_DOUBLE_EQ(evalNumber("número(\"42\")"), 42.0);
    EXPECT_TRUE(eval("número(\"x\")").isNil());
    EXPECT_DOUBLE_EQ(evalNumber("tamanho(\"olá\")"), 3.0);
    EXPECT_DOUBLE_EQ(evalNumber("tamanho(1 até 10)"), 10.0);
    EXPECT_TRUE(std::isinf(evalNumber("infinito")));
    EXPECT_TRUE(std::isnan(evalNumber("NaN")));
}

TEST_F(PreludeTest, NativeArityAndTypes)
{
    EXPECT_EQ(run("tipo()").diagnostic.kind, DiagnosticKind::ArityMismatch);
    EXPECT_EQ(run("tamanho(1)").diagnostic.kind, DiagnosticKind::TypeMismatch);
    EXPECT_EQ(run("Lista.tamanho(\"a\")").diagnostic.kind, DiagnosticKind::TypeMismatch);
}

TEST_F(PreludeTest, ListFunctions)
{
    EXPECT_EQ(evalString("Lista.insira([1], 2)"), "[1, 2]");
    EXPECT_EQ(evalString("Lista.insira([1, 3], 2, 1)"), "[1, 2, 3]");
    EXPECT_EQ(evalString("Lista.remova([1, 2, 3], 0)"), "[2, 3]");
    EXPECT_EQ(evalString("Lista.fatia([1, 2, 3, 4], 1, 3)"), "[2, 3]");
    EXPECT_EQ(evalString("Lista.fatia([1, 2, 3], 1)"), "[2, 3]");
    EXPECT_EQ(evalString("Lista.inverta([1, 2, 3])"), "[3, 2, 1]");
    EXPECT_EQ(evalString("Lista.junte([1, \"a\", 2], \"-\")"), "1-a-2");
    EXPECT_DOUBLE_EQ(evalNumber("Lista.tamanho([1, 2])"), 2.0);
}

TEST_F(PreludeTest, ListFunctionsReturnNewLists)
{
    eval("seja l = [1]\nseja m = Lista.insira(l, 2)\nexiba(l, m)");
    EXPECT_EQ(capturedOutput, "[1] [1, 2]\n");
}

TEST_F(PreludeTest, HigherOrderListFunctions)
{
    EXPECT_EQ(evalString("Lista.transforma([1, 2], função(x) -> x * 10)"), "[10, 20]");
    EXPECT_EQ(evalString("Lista.filtra([1, 2, 3, 4, 5, 6], função(x) -> x % 2 é 0)"), "[2, 4, 6]");
    eval("Lista.para_cada([\"a\", \"b\"], exiba)");
    EXPECT_EQ(capturedOutput, "a\nb\n");
}

TEST_F(PreludeTest, CallbackErrorsPropagate)
{
    auto r = run("Lista.transforma([1], função(x) -> x / 0)");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.kind, DiagnosticKind::DivisionByZero);
    EXPECT_EQ(engine.stackDepth(), 0u);
}

TEST_F(PreludeTest, ListIndexErrorsAreCatchable)
{
    eval("tente\n  Lista.remova([], 0)\ncapture erro\n  exiba(erro.tipo)\nfim");
    EXPECT_EQ(capturedOutput, "ÍndiceForaDosLimites\n");
}

TEST_F(PreludeTest, TextFunctions)
{
    EXPECT_EQ(evalString("Texto.maiúsculas(\"abc\")"), "ABC");
    EXPECT_EQ(evalString("Texto.minúsculas(\"ABC\")"), "abc");
    EXPECT_EQ(evalString("Texto.divida(\"a,b,,c\", \",\")"), "[\"a\", \"b\", \"\", \"c\"]");
    EXPECT_TRUE(eval("Texto.contém(\"banana\", \"ana\")").asBoolean());
    EXPECT_EQ(evalString("Texto.apare(\"  x y \\n\")"), "x y");
    EXPECT_DOUBLE_EQ(evalNumber("Texto.tamanho(\"ação\")"), 4.0);
}

TEST_F(PreludeTest, MathFunctions)
{
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.raiz(16)"), 4.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.absoluto(-3)"), 3.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.piso(2.7)"), 2.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.teto(2.1)"), 3.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.arredonda(2.5)"), 3.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.potência(2, 8)"), 256.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.máximo(3, 7, 2)"), 7.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.mínimo([4, 1, 9])"), 1.0);
    EXPECT_NEAR(evalNumber("Matemática.pi"), 3.14159265, 1e-8);
    EXPECT_EQ(run("Matemática.máximo()").diagnostic.kind, DiagnosticKind::ArityMismatch);
    EXPECT_EQ(run("Matemática.raiz(\"a\")").diagnostic.kind, DiagnosticKind::TypeMismatch);
}

TEST_F(PreludeTest, MoreListFunctions)
{
    EXPECT_DOUBLE_EQ(evalNumber("Lista.obtenha([5, 6], 1)"), 6.0);
    EXPECT_EQ(run("Lista.obtenha([5], 1)").diagnostic.kind, DiagnosticKind::IndexOutOfBounds);
    EXPECT_EQ(evalString("Lista.remova_todos([1, 2, 1, 3], 1)"), "[2, 3]");
    EXPECT_DOUBLE_EQ(evalNumber("Lista.índice_de([\"a\", \"b\"], \"b\")"), 1.0);
    EXPECT_TRUE(eval("Lista.índice_de([1], 9)").isNil());
    EXPECT_TRUE(eval("Lista.contém([1, 2], 2)").asBoolean());
    EXPECT_TRUE(eval("Lista.vazio([])").asBoolean());
    EXPECT_EQ(evalString("Lista.limpa([1, 2])"), "[]");
    EXPECT_EQ(evalString("Lista.de_intervalo(1 até 4)"), "[1, 2, 3, 4]");
    EXPECT_EQ(evalString("Lista.de_intervalo(3 até 1)"), "[]");
    EXPECT_EQ(run("Lista.de_intervalo(1 até 10^15)").diagnostic.kind, DiagnosticKind::InvalidRangeBound);
    EXPECT_EQ(evalString("Lista.de_texto(\"pé\")"), "[\"p\", \"é\"]");
}

TEST_F(PreludeTest, MoreTextFunctions)
{
    EXPECT_TRUE(eval("Texto.vazio(\"\")").asBoolean());
    EXPECT_EQ(evalString("Texto.para_lista(\"ão\")"), "[\"ã\", \"o\"]");
    EXPECT_DOUBLE_EQ(evalNumber("Texto.para_número(\"2.5\")"), 2.5);
    EXPECT_TRUE(eval("Texto.para_número(\"2x\")").isNil());
    EXPECT_TRUE(eval("Texto.começa_com(\"banana\", \"ban\")").asBoolean());
    EXPECT_FALSE(eval("Texto.termina_com(\"a\", \"banana\")").asBoolean());
    EXPECT_EQ(evalString("Texto.remova_prefixo(\"banana\", \"ba\")"), "nana");
    EXPECT_EQ(evalString("Texto.remova_sufixo(\"banana\", \"x\")"), "banana");
    EXPECT_DOUBLE_EQ(evalNumber("Texto.índice_de(\"ação!\", \"!\")"), 4.0);
    EXPECT_TRUE(eval("Texto.índice_de(\"abc\", \"z\")").isNil());
    EXPECT_EQ(evalString("Texto.subtexto(\"coração\", 2)"), "ração");
    EXPECT_EQ(evalString("Texto.subtexto(\"coração\", 4, 2)"), "çã");
    EXPECT_EQ(evalString("Texto.subtexto(\"abc\", 1, 10)"), "bc");
    EXPECT_EQ(run("Texto.subtexto(\"abc\", 4)").diagnostic.kind, DiagnosticKind::IndexOutOfBounds);
    EXPECT_EQ(evalString("Texto.inverta(\"pão\")"), "oãp");
    EXPECT_EQ(evalString("Texto.repita(\"ab\", 3)"), "ababab");
    EXPECT_EQ(run("Texto.repita(\"ab\", -1)").diagnostic.kind, DiagnosticKind::InvalidIndex);
    EXPECT_EQ(run("Texto.repita(\"ab\", 10^15)").diagnostic.kind, DiagnosticKind::InvalidIndex);
    EXPECT_EQ(evalString("Texto.substitua(\"a-b-c\", \"-\", \"+\")"), "a+b+c");
    EXPECT_EQ(evalString("Texto.substitua(\"abc\", \"\", \"x\")"), "abc");
}

TEST_F(PreludeTest, MoreMathFunctions)
{
    EXPECT_NEAR(evalNumber("Matemática.e"), 2.718281828, 1e-8);
    EXPECT_GT(evalNumber("Matemática.maior_número"), 1e308);
    EXPECT_LT(evalNumber("Matemática.menor_número"), -1e308);
    EXPECT_NEAR(evalNumber("Matemática.seno(Matemática.pi / 2)"), 1.0, 1e-12);
    EXPECT_NEAR(evalNumber("Matemática.cosseno(0)"), 1.0, 1e-12);
    EXPECT_NEAR(evalNumber("Matemática.arco_tangente2(1, 1)"), 0.785398163, 1e-8);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.trunca(-2.7)"), -2.0);
    EXPECT_NEAR(evalNumber("Matemática.parte_fracionária(2.25)"), 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.sinal(-4)"), -1.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.raiz_cúbica(27)"), 3.0);
    EXPECT_NEAR(evalNumber("Matemática.logaritmo(8, 2)"), 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.logaritmo_10(1000)"), 3.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.hipotenusa(3, 4)"), 5.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.resto(-7, 3)"), -1.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.resto_euclidiano(-7, 3)"), 2.0);
    EXPECT_EQ(run("Matemática.resto(1, 0)").diagnostic.kind, DiagnosticKind::DivisionByZero);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.limita(15, 0, 10)"), 10.0);
    EXPECT_DOUBLE_EQ(evalNumber("Matemática.fatorial(5)"), 120.0);
    EXPECT_TRUE(std::isinf(evalNumber("Matemática.fatorial(171)")));
    EXPECT_EQ(run("Matemática.fatorial(1.5)").diagnostic.kind, DiagnosticKind::TypeMismatch);
    EXPECT_NEAR(evalNumber("Matemática.graus_para_radianos(180)"), 3.14159265, 1e-8);
    for (int i = 0; i < 20; ++i) {
        double x = evalNumber("Matemática.aleatório(2, 5)");
        EXPECT_GE(x, 2.0);
        EXPECT_LT(x, 5.0);
    }
}

TEST_F(PreludeTest, OutputFunctions)
{
    eval("escreva(\"a\", 1)\nexiba(\"!\")\nSaída.escreva(\"b\")\nSaída.exiba()");
    EXPECT_EQ(capturedOutput, "a 1!\nb\n");
}

TEST_F(PreludeTest, InputFunctionsReadThroughHook)
{
    std::vector<std::string> lines = {"Ana", "42"};
    size_t next = 0;
    engine.setInputFunc([&](std::string &line) {
        if (next >= lines.size())
            return false;
        line = lines[next++];
        return true;
    });
    EXPECT_EQ(evalString("leia(\"nome: \")"), "Ana");
    EXPECT_EQ(capturedOutput, "nome: ");
    EXPECT_EQ(evalString("Saída.entrada()"), "42");
    EXPECT_TRUE(eval("entrada()").isNil());
}

TEST_F(PreludeTest, ErrorConstructor)
{
    EXPECT_EQ(evalString("Erro.crie(\"Validação\", \"campo vazio\")"),
              "{\"tipo\": \"Validação\", \"mensagem\": \"campo vazio\"}");
}

TEST_F(PreludeTest, PreludeIsSharedBetweenEngines)
{
    Engine other;
    Prelude::install(other);
    EXPECT_EQ(Prelude::bindings(), Prelude::bindings());
    ASSERT_NE(other.getVariable("exiba"), nullptr);
    EXPECT_EQ(other.getVariable("exiba")->read(), engine.getVariable("exiba")->read());
}
