/**
 * @file SignalConditioner.cpp
 * @brief Implementação do condicionamento do sinal.
 */

#include "SignalConditioner.h"
#include <math.h>

namespace SignalConditioner {

    namespace {
        inline float clampUnit(float value) {
            if (value < 0.0f) return 0.0f;
            if (value > 1.0f) return 1.0f;
            return value;
        }

        float logarithmicCurve(float linear, float dbMin, float dbMax) {
            // Silêncio exato na posição zero, sem resíduo do mapeamento em dB
            if (linear <= 0.0f) {
                return 0.0f;
            }

            float ampMin = dbToAmplitude(dbMin);
            float ampMax = dbToAmplitude(dbMax);
            float span = ampMax - ampMin;

            // Faixa em dB degenerada: comporta-se como a curva linear
            if (!(span > 0.0f)) {
                return linear;
            }

            float db = dbMin + (dbMax - dbMin) * linear;
            float amplitude = dbToAmplitude(db);

            return clampUnit((amplitude - ampMin) / span);
        }
    } // namespace

    float normalize(uint32_t raw, uint32_t min, uint32_t max) {
        if (max <= min) {
            return 0.0f;
        }

        uint32_t clamped = raw;
        if (clamped < min) clamped = min;
        if (clamped > max) clamped = max;

        return static_cast<float>(clamped - min) / static_cast<float>(max - min);
    }

    float applyCurve(float linear, VolumeCurve curve, float dbMin, float dbMax) {
        float x = clampUnit(linear);

        switch (curve) {
            case VolumeCurve::LOGARITHMIC:
                return logarithmicCurve(x, dbMin, dbMax);

            case VolumeCurve::EXPONENTIAL:
                return x * x;

            case VolumeCurve::LINEAR:
            default:
                return x;
        }
    }

    float linearToDb(float linear, float dbMin, float dbMax) {
        if (linear <= DB_FLOOR_EPSILON) {
            return dbMin;
        }

        return dbMin + (dbMax - dbMin) * linear;
    }

    float dbToAmplitude(float db) {
        return powf(10.0f, db / 20.0f);
    }

    const char* curveName(VolumeCurve curve) {
        switch (curve) {
            case VolumeCurve::LINEAR:       return "linear";
            case VolumeCurve::LOGARITHMIC:  return "logarithmic";
            case VolumeCurve::EXPONENTIAL:  return "exponential";
            default:                        return "unknown";
        }
    }

} // namespace SignalConditioner
