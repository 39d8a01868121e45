#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "pipeline/RunParameters.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QTemporaryDir>

DOCTEST_TEST_CASE(defaults_match_the_machine)
{
    const pipeline::RunParameters params;
    DOCTEST_CHECK(params.spline.xStart == doctest::Approx(115.5));
    DOCTEST_CHECK(params.spline.xEnd == doctest::Approx(205.5));
    DOCTEST_CHECK(params.spline.zStart == doctest::Approx(0.0));
    DOCTEST_CHECK(params.spline.zEnd == doctest::Approx(100.0));
    DOCTEST_CHECK(params.layerHeight_mm == doctest::Approx(0.28));
    DOCTEST_CHECK(params.warningAngleDeg == doctest::Approx(100.0));
    DOCTEST_CHECK(params.discretization_mm == doctest::Approx(0.01));
    DOCTEST_CHECK(params.linkage.la == doctest::Approx(28.4));
    DOCTEST_CHECK(params.linkage.lb == doctest::Approx(47.7));
    DOCTEST_CHECK(params.actuator.command == "MANUAL_STEPPER");
    DOCTEST_CHECK(params.actuator.stepper == "b_stepper");

    QStringList errors;
    DOCTEST_CHECK(params.validate(errors));
    DOCTEST_CHECK(errors.isEmpty());
}

DOCTEST_TEST_CASE(json_overlays_only_present_keys)
{
    const QByteArray json = R"({
        "spline_x": [100, 200],
        "layer_height": 0.2,
        "annotate_bands": false,
        "linkage": { "la": 30, "b_range": [-60, 60] },
        "controller": { "stepper": "tilt" }
    })";

    pipeline::RunParameters params;
    QStringList warnings;
    DOCTEST_REQUIRE(pipeline::loadParametersFromJson(json, params, warnings));
    DOCTEST_CHECK(warnings.isEmpty());

    DOCTEST_CHECK(params.spline.xStart == doctest::Approx(100.0));
    DOCTEST_CHECK(params.spline.xEnd == doctest::Approx(200.0));
    DOCTEST_CHECK(params.spline.zEnd == doctest::Approx(100.0));
    DOCTEST_CHECK(params.layerHeight_mm == doctest::Approx(0.2));
    DOCTEST_CHECK_FALSE(params.annotateBands);
    DOCTEST_CHECK(params.linkage.la == doctest::Approx(30.0));
    DOCTEST_CHECK(params.linkage.lb == doctest::Approx(47.7));
    DOCTEST_CHECK(params.linkage.bMinDeg == doctest::Approx(-60.0));
    DOCTEST_CHECK(params.linkage.bMaxDeg == doctest::Approx(60.0));
    DOCTEST_CHECK(params.actuator.command == "MANUAL_STEPPER");
    DOCTEST_CHECK(params.actuator.stepper == "tilt");
}

DOCTEST_TEST_CASE(unknown_keys_warn_without_failing)
{
    pipeline::RunParameters params;
    QStringList warnings;
    DOCTEST_CHECK(pipeline::loadParametersFromJson(R"({"nozzle": 0.4, "warning_angle": 45})", params, warnings));
    DOCTEST_REQUIRE(warnings.size() == 1);
    DOCTEST_CHECK(warnings.front().contains(QStringLiteral("nozzle")));
    DOCTEST_CHECK(params.warningAngleDeg == doctest::Approx(45.0));
}

DOCTEST_TEST_CASE(bad_documents_leave_parameters_untouched)
{
    pipeline::RunParameters params;
    QStringList warnings;

    DOCTEST_CHECK_FALSE(pipeline::loadParametersFromJson("{ not json", params, warnings));
    DOCTEST_CHECK_FALSE(pipeline::loadParametersFromJson("[1, 2]", params, warnings));
    DOCTEST_CHECK_FALSE(pipeline::loadParametersFromJson("", params, warnings));
    DOCTEST_CHECK_FALSE(
        pipeline::loadParametersFromJson(R"({"layer_height": 0.3, "spline_z": [0]})", params, warnings));
    DOCTEST_CHECK_FALSE(pipeline::loadParametersFromJson(R"({"layer_height": "thin"})", params, warnings));
    DOCTEST_CHECK(warnings.size() == 5);

    DOCTEST_CHECK(params.layerHeight_mm == doctest::Approx(0.28));
    DOCTEST_CHECK(params.spline.zEnd == doctest::Approx(100.0));
}

DOCTEST_TEST_CASE(validation_lists_every_problem)
{
    pipeline::RunParameters params;
    params.spline.zEnd = -1.0;
    params.layerHeight_mm = -0.1;
    params.warningAngleDeg = -5.0;
    params.linkage.lb = 0.0;
    params.actuator.stepper.clear();

    QStringList errors;
    DOCTEST_CHECK_FALSE(params.validate(errors));
    DOCTEST_CHECK(errors.size() == 5);
}

DOCTEST_TEST_CASE(parameters_load_from_file_and_serialize)
{
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    pipeline::RunParameters original;
    original.spline.xEnd = 180.0;
    original.discretization_mm = 0.0;
    original.actuator.command = "ACTUATE";

    const QString path = QDir(dir.path()).filePath(QStringLiteral("params.json"));
    {
        QFile file(path);
        DOCTEST_REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(QJsonDocument(pipeline::toJson(original)).toJson());
    }

    pipeline::RunParameters loaded;
    QStringList warnings;
    DOCTEST_REQUIRE(pipeline::loadParametersFromFile(path, loaded, warnings));
    DOCTEST_CHECK(warnings.isEmpty());
    DOCTEST_CHECK(loaded.spline.xEnd == doctest::Approx(180.0));
    DOCTEST_CHECK(loaded.discretization_mm == doctest::Approx(0.0));
    DOCTEST_CHECK(loaded.actuator.command == "ACTUATE");

    DOCTEST_CHECK_FALSE(
        pipeline::loadParametersFromFile(QDir(dir.path()).filePath(QStringLiteral("missing.json")), loaded, warnings));
    DOCTEST_CHECK(warnings.size() == 1);
}
