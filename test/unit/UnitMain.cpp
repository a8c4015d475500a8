//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runScalarKindTests();
bool runLiteralRenderTests();
bool runWireCodecTests();
bool runSchemaParserTests();
bool runTextFormatTests();
bool runCanonicalizeTests();
bool runCorpusTests();
bool runReferenceEncoderTests();
bool runArtifactEmitterTests();
bool runDepfileRenderTests();
bool runGeneratorConfigTests();
bool runGoldenPipelineTests();

int main()
{
    bool ok = true;
    ok      = runScalarKindTests() && ok;
    ok      = runLiteralRenderTests() && ok;
    ok      = runWireCodecTests() && ok;
    ok      = runSchemaParserTests() && ok;
    ok      = runTextFormatTests() && ok;
    ok      = runCanonicalizeTests() && ok;
    ok      = runCorpusTests() && ok;
    ok      = runReferenceEncoderTests() && ok;
    ok      = runArtifactEmitterTests() && ok;
    ok      = runDepfileRenderTests() && ok;
    ok      = runGeneratorConfigTests() && ok;
    ok      = runGoldenPipelineTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
